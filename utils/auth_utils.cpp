#include "auth_utils.h"
#include "core/logger.h"
#include <filesystem>
#include <fstream>


namespace ticketmcp {
    namespace utils {

        namespace {
            void trim(std::string &value) {
                value.erase(0, value.find_first_not_of(" \t\r\n"));
                value.erase(value.find_last_not_of(" \t\r\n") + 1);
            }
        }// namespace

        std::vector<std::string> load_auth_keys_from_file(const std::string &keys_file_path) {
            std::vector<std::string> keys;

            std::filesystem::path full_path(keys_file_path);
            if (!std::filesystem::exists(full_path)) {
                TICKETMCP_WARN("Auth keys file not found: {}", full_path.string());
                return keys;
            }

            std::ifstream file(full_path);
            if (!file.is_open()) {
                TICKETMCP_ERROR("Failed to open auth keys file: {}", full_path.string());
                return keys;
            }

            std::string line;
            while (std::getline(file, line)) {
                trim(line);
                if (line.empty() || line[0] == '#') {
                    continue;
                }
                keys.push_back(line);
            }

            TICKETMCP_DEBUG("Loaded {} auth keys from {}", keys.size(), full_path.string());
            return keys;
        }

    }// namespace utils
}// namespace ticketmcp
