/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/localization.hpp"

namespace speedwatch {

namespace {

constexpr Labels kEnglish{
    .report_title = "📊 Internet Speed Report",
    .single_title = "📊 Internet Speed Report",
    .summary = "Summary",
    .download = "Download",
    .upload = "Upload",
    .ping = "Ping",
    .status = "Status",
    .test_server = "Test Server",
    .isp = "ISP",
    .location = "Location",
    .os = "OS",
    .server = "Server",
    .description = "Description",
    .time = "Time",
    .error = "Error",
    .no_data = "No data",
    .stale = "Stale",
    .last_seen = "last seen {} min ago",
    .stale_since = "no report for {} min",
    .cluster_ok = "All nodes OK",
    .cluster_degraded = "Attention: some nodes are degraded or offline",
    .tier_very_low = "Very Low",
    .tier_low = "Low",
    .tier_medium = "Normal",
    .tier_good = "Good",
    .tier_excellent = "Excellent",
    .node_ok = "Good",
    .node_degraded = "Degraded",
    .node_offline = "Offline",
    .settings_title = "⚙️ Report settings",
    .settings_language = "Language",
    .settings_view = "View",
    .view_compact = "Compact",
    .view_detailed = "Detailed",
    .saved = "Saved",
    .save_failed = "Could not save, try again later",
};

constexpr Labels kRussian{
    .report_title = "📊 Отчет о скорости интернета",
    .single_title = "📊 Отчет о скорости интернета",
    .summary = "Итоги",
    .download = "Загрузка",
    .upload = "Отдача",
    .ping = "Пинг",
    .status = "Статус",
    .test_server = "Тестовый сервер",
    .isp = "Провайдер",
    .location = "Расположение",
    .os = "ОС",
    .server = "Сервер",
    .description = "Описание",
    .time = "Время",
    .error = "Ошибка",
    .no_data = "Нет данных",
    .stale = "Устарело",
    .last_seen = "обновлено {} мин назад",
    .stale_since = "нет отчета {} мин",
    .cluster_ok = "Все узлы в норме",
    .cluster_degraded = "Внимание: есть узлы с просадкой или без связи",
    .tier_very_low = "Очень низко",
    .tier_low = "Низко",
    .tier_medium = "Нормально",
    .tier_good = "Хорошо",
    .tier_excellent = "Отлично",
    .node_ok = "Хорошо",
    .node_degraded = "Просадка",
    .node_offline = "Офлайн",
    .settings_title = "⚙️ Настройки отчета",
    .settings_language = "Язык",
    .settings_view = "Вид",
    .view_compact = "Компактный",
    .view_detailed = "Подробный",
    .saved = "Сохранено",
    .save_failed = "Не удалось сохранить, попробуйте позже",
};

}  // namespace

const Labels& labels_for(Language language) noexcept {
    switch (language) {
        case Language::Ru:
            return kRussian;
        case Language::En:
            return kEnglish;
    }
    return kEnglish;
}

std::string_view tier_label(const Labels& labels, Tier tier) noexcept {
    switch (tier) {
        case Tier::VeryLow:
            return labels.tier_very_low;
        case Tier::Low:
            return labels.tier_low;
        case Tier::Medium:
            return labels.tier_medium;
        case Tier::Good:
            return labels.tier_good;
        case Tier::Excellent:
            return labels.tier_excellent;
    }
    return labels.tier_very_low;
}

std::string_view node_status_label(const Labels& labels, NodeStatus status) noexcept {
    switch (status) {
        case NodeStatus::Ok:
            return labels.node_ok;
        case NodeStatus::Degraded:
            return labels.node_degraded;
        case NodeStatus::Offline:
            return labels.node_offline;
    }
    return labels.node_offline;
}

}  // namespace speedwatch
