#pragma once
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace ticketmcp::utils {

    namespace detail {
        inline std::mt19937_64 &id_engine() {
            thread_local std::mt19937_64 engine{std::random_device{}()};
            return engine;
        }

        inline std::string random_hex(int words) {
            std::uniform_int_distribution<uint64_t> dist;
            std::stringstream ss;
            for (int i = 0; i < words; ++i) {
                ss << std::hex << std::setw(16) << std::setfill('0') << dist(id_engine());
            }
            return ss.str();
        }
    }// namespace detail

    /// 32 hex characters, used for sessions and connections.
    inline std::string generate_session_id() {
        return detail::random_hex(2);
    }

    /// Identifier for tool calls that arrived without a caller-supplied id.
    inline std::string generate_request_id() {
        return "srv-" + detail::random_hex(1);
    }

}// namespace ticketmcp::utils
