#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef FEM1D_LOGGING_HPP
#define FEM1D_LOGGING_HPP

#include <iostream>
#include <sstream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <map>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace utils {
    class logging{
    public:
        // generate a date string with the current date
        std::string generateDateString();

        // generate timestamp
        std::string generateTimestamp();

        /**
         * @brief Write a run log as JSON
         * 
         * "date" and "timestamp" are added to the entries.
         * 
         * @param dataMap Entries of the run
         * @param directory Target directory, created if missing
         * @return Path of the written file
         * @throws std::runtime_error if the file cannot be opened
         */
        std::string buildLogFile(std::map<std::string, std::string>& dataMap, const std::string& directory = "log");
    };
}

#endif 
