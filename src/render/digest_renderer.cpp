/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/digest_renderer.hpp"

#include <chrono>
#include <format>
#include <string_view>
#include <vector>

#include "include/localization.hpp"
#include "include/utils.hpp"

namespace speedwatch::Renderer {

namespace {

constexpr std::string_view kSeparator = "———";

std::string format_time(TimePoint tp) {
    return std::format("{:%Y-%m-%d %H:%M} UTC", std::chrono::floor<std::chrono::minutes>(tp));
}

std::string localized_minutes(std::string_view pattern, std::chrono::minutes age) {
    long long minutes = age.count();
    return std::vformat(pattern, std::make_format_args(minutes));
}

std::string node_title(const NodeView& node) {
    const std::string name = html_escape(node.meta.display_name.empty() ? node.meta.node_id
                                                                        : node.meta.display_name);
    if (node.meta.flag.empty()) return name;
    return std::format("{} {}", node.meta.flag, name);
}

std::string_view status_glyph(NodeStatus status) {
    switch (status) {
        case NodeStatus::Ok:
            return "✅";
        case NodeStatus::Degraded:
            return "⚠️";
        case NodeStatus::Offline:
            return "🔴";
    }
    return "❓";
}

std::string header(const AggregatedView& view, const Labels& l) {
    return std::format("<b>{}</b>\n🕐 {}", l.report_title, format_time(view.generated_at));
}

void append_optional(std::string& out, std::string_view icon, std::string_view label,
                     const std::optional<std::string>& value) {
    if (!value || value->empty()) return;
    out += std::format("\n{} {}: {}", icon, label, html_escape(*value));
}

std::string offline_text(const NodeView& node, const Labels& l) {
    if (node.freshness == Freshness::Stale) {
        return std::format("🔴 {} ({})", l.stale, localized_minutes(l.stale_since, node.age));
    }
    return std::format("🔴 {}", l.no_data);
}

}  // namespace

std::string render_digest(const AggregatedView& view, Language language, ViewMode mode) {
    switch (mode) {
        case ViewMode::Detailed:
            return render_detailed(view, language);
        case ViewMode::Compact:
            return render_compact(view, language);
    }
    return render_compact(view, language);
}

std::string render_compact(const AggregatedView& view, Language language) {
    const Labels& l = labels_for(language);
    std::string out = header(view, l);
    out += "\n";

    for (const auto& node : view.nodes) {
        out += "\n";
        if (node.fresh() && node.last_report) {
            out += std::format("{} — {} {}", node_title(node), tier_glyph(node.tier),
                               format_speed(node.last_report->download_mbps));
        } else {
            out += std::format("{} — {}", node_title(node), offline_text(node, l));
        }
    }
    return out;
}

std::string render_detailed(const AggregatedView& view, Language language) {
    const Labels& l = labels_for(language);
    std::string out = header(view, l);

    if (view.cluster == ClusterStatus::Ok) {
        out += std::format("\n✅ <b>{}</b>", l.cluster_ok);
    } else {
        out += std::format("\n⚠️ <b>{}</b>", l.cluster_degraded);
    }
    out += std::format("\n{}: ✅ {} · ⚠️ {} · 🔴 {}", l.summary, view.summary.ok,
                       view.summary.degraded, view.summary.offline);

    for (std::size_t i = 0; i < view.nodes.size(); ++i) {
        const NodeView& node = view.nodes[i];
        out += std::format("\n\n<b>{}</b>", node_title(node));

        if (node.fresh() && node.last_report) {
            const Report& r = *node.last_report;
            out += std::format("\n⬇️ {}: {}", l.download, format_speed(r.download_mbps));
            out += std::format("\n⬆️ {}: {}", l.upload, format_speed(r.upload_mbps));
            out += std::format("\n📡 {}: {}", l.ping, format_ping(r.ping_ms));
            out += std::format("\n📈 {}: {} {} ({} {})", l.status, tier_glyph(node.tier),
                               tier_label(l, node.tier), status_glyph(node.status),
                               node_status_label(l, node.status));
            append_optional(out, "🌐", l.test_server, r.test_server);
            append_optional(out, "🏢", l.isp, r.isp);
            append_optional(out, "📍", l.location, r.location);
            append_optional(out, "💻", l.os, r.os_info);
            out += std::format("\n🕐 {}", localized_minutes(l.last_seen, node.age));
        } else {
            out += "\n" + offline_text(node, l);
        }

        if (i + 1 < view.nodes.size()) {
            out += std::format("\n\n{}", kSeparator);
        }
    }
    return out;
}

std::string render_single(const SingleReport& report, const Thresholds& thresholds,
                          Language language) {
    const Labels& l = labels_for(language);
    std::string out = std::format("<b>{}</b>\n", l.single_title);

    out += std::format("\n🖥 <b>{}:</b> {}", l.server, html_escape(report.server_name));
    if (!report.server_location.empty()) {
        out += std::format(" ({})", html_escape(report.server_location));
    }
    if (!report.description.empty()) {
        out += std::format("\n📝 <b>{}:</b> {}", l.description, html_escape(report.description));
    }
    if (!report.identifier.empty()) {
        out += std::format("\n🆔 <b>ID:</b> {}", html_escape(report.identifier));
    }
    out += std::format("\n🕐 <b>{}:</b> {}\n", l.time, format_time(report.generated_at));

    const Measurement& m = report.measurement;
    if (!m.success) {
        out += std::format("\n❌ <b>{}:</b> {}\n", l.error, html_escape(m.error));
    } else {
        const Tier tier = classify(m.download_mbps, m.upload_mbps, m.ping_ms, thresholds);
        out += std::format("\n⬇️ <b>{}:</b> {}", l.download, format_speed(m.download_mbps));
        out += std::format("\n⬆️ <b>{}:</b> {}", l.upload, format_speed(m.upload_mbps));
        out += std::format("\n📡 <b>{}:</b> {}", l.ping, format_ping(m.ping_ms));
        out += std::format("\n\n📈 <b>{}:</b> {} {}\n", l.status, tier_glyph(tier),
                           tier_label(l, tier));

        if (!m.server_name.empty()) {
            std::string server = m.server_name;
            if (!m.server_location.empty()) server += " (" + m.server_location + ")";
            out += std::format("\n🌐 <b>{}:</b> {}", l.test_server, html_escape(server));
        }
        if (!m.isp.empty()) {
            out += std::format("\n🏢 <b>{}:</b> {}", l.isp, html_escape(m.isp));
        }
    }
    if (!report.os_info.empty()) {
        out += std::format("\n💻 <b>{}:</b> {}", l.os, html_escape(report.os_info));
    }
    return out;
}

}  // namespace speedwatch::Renderer
