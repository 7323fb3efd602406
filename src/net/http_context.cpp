/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/http_context.hpp"

#include <mutex>
#include <stdexcept>

#include <curl/curl.h>
#include <openssl/crypto.h>

#include "include/log.hpp"

namespace speedwatch {

namespace {

struct GlobalInit {
    std::mutex mutex;
    int users = 0;
};

GlobalInit& global() {
    static GlobalInit instance;
    return instance;
}

void init_libraries() {
    // libcrypto backs the token digests as well as curl's TLS.
    if (OPENSSL_init_crypto(OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) == 0) {
        throw std::runtime_error("Failed to initialize OpenSSL crypto library");
    }
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw std::runtime_error("Failed to initialize libcurl globally");
    }

    const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
    if (!info || !(info->features & CURL_VERSION_SSL)) {
        curl_global_cleanup();
        throw std::runtime_error("libcurl was built without TLS support; the Telegram API needs HTTPS");
    }
    log::debug("libcurl {} ({}), {}", info->version, info->ssl_version ? info->ssl_version : "no TLS",
               OpenSSL_version(OPENSSL_VERSION));
}

}  // namespace

HttpContext::HttpContext() {
    auto& g = global();
    std::lock_guard lock(g.mutex);
    if (g.users == 0) {
        init_libraries();
    }
    ++g.users;
}

HttpContext::~HttpContext() {
    auto& g = global();
    std::lock_guard lock(g.mutex);
    if (--g.users == 0) {
        curl_global_cleanup();
    }
}

}  // namespace speedwatch
