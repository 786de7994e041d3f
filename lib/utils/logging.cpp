#include "utils/logging.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

std::string utils::logging::generateDateString(){
    // Get the current time as a time_point object
    auto now = std::chrono::system_clock::now();

    // Convert the time_point object to a time_t object
    std::time_t currentTime = std::chrono::system_clock::to_time_t(now);

    // Convert the time_t object to a tm struct for formatting
    std::tm* localTime = std::localtime(&currentTime);

    std::ostringstream dateStream;
    dateStream << std::put_time(localTime, "%Y-%m-%d %H:%M:%S");
    return dateStream.str();
}

std::string utils::logging::generateTimestamp(){
    auto now = std::chrono::system_clock::now();
    return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count());
}

std::string utils::logging::buildLogFile(std::map<std::string, std::string>& dataMap, const std::string& directory){
    // Generate the date and timestamp
    std::string dateString = generateDateString();
    std::string timestamp = generateTimestamp();

    dataMap["date"] = dateString;
    dataMap["timestamp"] = timestamp;

    nlohmann::json j = dataMap;

    std::filesystem::path dir(directory.empty() ? "." : directory);
    std::filesystem::create_directories(dir);

    std::string filename = (dir / ("log_" + timestamp + ".json")).string();
    std::ofstream o(filename);
    if (!o.is_open()) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
    o << std::setw(4) << j << std::endl;  // Use std::setw(4) for pretty-printing
    std::cout << "Log written to: " << filename << std::endl;

    return filename;
}
