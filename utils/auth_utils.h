#pragma once

#include <string>
#include <vector>

namespace ticketmcp {
    namespace utils {

        /**
        * @brief Load accepted API keys or bearer tokens from a file
        *
        * One key per line. Blank lines and lines starting with '#' are skipped.
        *
        * @param keys_file_path Path to the keys file, relative to the working directory
        * @return std::vector<std::string> Loaded keys, empty when the file is missing
        */
        std::vector<std::string> load_auth_keys_from_file(const std::string &keys_file_path);

    }// namespace utils
}// namespace ticketmcp
