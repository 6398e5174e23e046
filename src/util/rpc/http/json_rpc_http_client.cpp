// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "json_rpc_http_client.hpp"

#include "epoll_event_handler.hpp"

namespace stakescan::rpc {
    namespace {
        /// Performs libcurl global initialization once per process, before
        /// any scanner thread creates a handle.
        const curl_initializer curl_init{};

        /// Connection establishment timeout in seconds.
        constexpr long connect_timeout{5};
    }

    curl_initializer::curl_initializer() {
        curl_global_init(CURL_GLOBAL_ALL);
    }

    curl_initializer::~curl_initializer() {
        curl_global_cleanup();
    }

    json_rpc_http_client::json_rpc_http_client(
        std::string endpoint,
        long timeout,
        std::shared_ptr<logging::log> log)
        : m_endpoint(std::move(endpoint)),
          m_timeout(timeout),
          m_log(std::move(log)) {
        m_builder["indentation"] = "";
    }

    auto json_rpc_http_client::init() -> bool {
        m_ev_handler = std::make_unique<epoll_event_handler>();
        if(!m_ev_handler->init()) {
            m_log->error("Failed to initialize event handler");
            return false;
        }
        m_multi_handle = curl_multi_init();
        if(m_multi_handle == nullptr) {
            m_log->error("Failed to initialize libcurl multi handle");
            return false;
        }
        curl_multi_setopt(m_multi_handle,
                          CURLMOPT_TIMERFUNCTION,
                          timer_callback);
        curl_multi_setopt(m_multi_handle, CURLMOPT_TIMERDATA, this);
        curl_multi_setopt(m_multi_handle,
                          CURLMOPT_SOCKETFUNCTION,
                          socket_callback);
        curl_multi_setopt(m_multi_handle, CURLMOPT_SOCKETDATA, this);
        m_headers = curl_slist_append(m_headers, "Content-Type: text/plain");
        return true;
    }

    json_rpc_http_client::~json_rpc_http_client() {
        for(auto& [handle, t] : m_transfers) {
            if(curl_multi_remove_handle(m_multi_handle, handle) != CURLM_OK) {
                m_log->error("Error removing handle");
            }
            curl_easy_cleanup(handle);
            t->m_cb(std::nullopt);
        }
        if(m_multi_handle != nullptr
           && curl_multi_cleanup(m_multi_handle) != CURLM_OK) {
            m_log->error("Error cleaning up multi_handle");
        }
        while(!m_handles.empty()) {
            auto* handle = m_handles.front();
            curl_easy_cleanup(handle);
            m_handles.pop();
        }
        curl_slist_free_all(m_headers);
    }

    void json_rpc_http_client::call(const std::string& method,
                                    Json::Value params,
                                    callback_type result_fn) {
        CURL* handle{};
        if(m_handles.empty()) {
            handle = curl_easy_init();
            if(handle == nullptr) {
                m_log->error("Failed to create libcurl handle");
                result_fn(std::nullopt);
                return;
            }
            curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
            curl_easy_setopt(handle, CURLOPT_URL, m_endpoint.c_str());
            curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_data);
            curl_easy_setopt(handle, CURLOPT_HTTPHEADER, m_headers);
            curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, m_timeout);
            curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, connect_timeout);
            curl_easy_setopt(handle, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        } else {
            handle = m_handles.front();
            m_handles.pop();
        }

        auto it = m_transfers.emplace(handle, std::make_unique<transfer>());
        auto& tf = it.first->second;
        tf->m_cb = std::move(result_fn);

        curl_easy_setopt(handle, CURLOPT_WRITEDATA, tf.get());

        auto payload = Json::Value();
        payload["jsonrpc"] = "1.0";
        payload["id"] = Json::UInt64(m_next_id++);
        payload["method"] = method;
        payload["params"] = std::move(params);

        tf->m_payload = Json::writeString(m_builder, payload);
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, tf->m_payload.c_str());

        if(curl_multi_add_handle(m_multi_handle, handle) != CURLM_OK) {
            m_log->error("Error adding handle for", method);
            auto node = m_transfers.extract(handle);
            curl_easy_cleanup(handle);
            node.mapped()->m_cb(std::nullopt);
        }
    }

    auto json_rpc_http_client::pending() const -> size_t {
        return m_transfers.size();
    }

    auto json_rpc_http_client::write_data(void* ptr,
                                          size_t size,
                                          size_t nmemb,
                                          struct transfer* t) -> size_t {
        auto total_sz = size * nmemb;
        t->m_result.write(static_cast<char*>(ptr),
                          static_cast<std::streamsize>(total_sz));
        return total_sz;
    }

    void json_rpc_http_client::complete(CURLMsg* msg, transfer& tf) {
        if(msg->msg != CURLMSG_DONE) {
            tf.m_cb(std::nullopt);
            return;
        }

        if(msg->data.result != CURLE_OK) {
            m_log->debug("CURL error:", curl_easy_strerror(msg->data.result));
            tf.m_cb(std::nullopt);
            return;
        }

        long http_code = 0;
        curl_easy_getinfo(msg->easy_handle, CURLINFO_RESPONSE_CODE, &http_code);

        // bitcoind reports RPC-level errors with a 404 or 500 status and a
        // JSON error object in the body, so the body is parsed either way.
        auto res = Json::Value();
        auto r = Json::Reader();
        const auto body = tf.m_result.str();
        if(!r.parse(body, res, false) || !res.isObject()) {
            m_log->debug("Unparseable response, HTTP status",
                        http_code,
                        "size",
                        body.size());
            tf.m_cb(std::nullopt);
            return;
        }

        if(http_code / 100 != 2 && !res.isMember("error")) {
            m_log->debug("Bad return code:", http_code);
            tf.m_cb(std::nullopt);
            return;
        }

        tf.m_cb(std::move(res));
    }

    auto json_rpc_http_client::pump() -> bool {
        auto maybe_events = m_ev_handler->poll();
        if(!maybe_events.has_value()) {
            m_log->error("Polling error");
            return false;
        }
        auto& events = maybe_events.value();
        if(events.empty()) {
            return true;
        }

        int running{};
        for(auto& [fd, is_timeout] : events) {
            if(is_timeout) {
                curl_multi_socket_action(m_multi_handle,
                                         CURL_SOCKET_TIMEOUT,
                                         0,
                                         &running);
                continue;
            }

            curl_multi_socket_action(m_multi_handle,
                                     static_cast<curl_socket_t>(fd),
                                     0,
                                     &running);
        }

        int q_depth{};
        do {
            auto* m = curl_multi_info_read(m_multi_handle, &q_depth);
            if(m == nullptr) {
                break;
            }

            auto* handle = m->easy_handle;
            auto it = m_transfers.extract(handle);
            if(it.empty()) {
                m_log->error("Completed transfer has no pending request");
                return false;
            }

            if(curl_multi_remove_handle(m_multi_handle, handle) != CURLM_OK) {
                m_log->error("Error removing multi handle");
                curl_easy_cleanup(handle);
                it.mapped()->m_cb(std::nullopt);
                return false;
            }
            m_handles.push(handle);

            complete(m, *it.mapped());
        } while(q_depth > 0);

        return true;
    }

    auto json_rpc_http_client::socket_callback(CURL* /* handle */,
                                               curl_socket_t s,
                                               int what,
                                               json_rpc_http_client* c,
                                               void* /* socketp */) -> int {
        event_handler::event_type et{};
        switch(what) {
            case CURL_POLL_REMOVE:
                et = event_handler::event_type::remove;
                break;
            case CURL_POLL_INOUT:
                et = event_handler::event_type::inout;
                break;
            case CURL_POLL_IN:
                et = event_handler::event_type::in;
                break;
            case CURL_POLL_OUT:
                et = event_handler::event_type::out;
                break;
            default:
                return 0;
        }

        if(!c->m_ev_handler->register_fd(s, et)) {
            c->m_log->debug("Failed to update socket registration for fd", s);
            return -1;
        }

        return 0;
    }

    auto json_rpc_http_client::timer_callback(CURLM* /* multi_handle */,
                                              long timeout_ms,
                                              json_rpc_http_client* c) -> int {
        c->m_ev_handler->set_timeout(timeout_ms);
        return 0;
    }
}
