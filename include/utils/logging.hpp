#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef HOMCELL_LOGGING_HPP
#define HOMCELL_LOGGING_HPP

#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace utils {
    class logging{
    public:
        // generate a date string with the current date
        std::string generateDateString();

        // generate timestamp
        std::string generateTimestamp();

        // build log file in the given directory, returns its path
        std::string buildLogFile(std::map<std::string, std::string>& dataMap, const std::string& directory = "log");
    };
}

#endif
