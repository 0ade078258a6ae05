/*******************************************************************************
    Project: Drone Pipeline Worker Framework

    File: logger.cpp

    Description:
        Definitions of the Logger's static members. The header holds the
        implementation; static data members need exactly one definition in
        one translation unit.
*******************************************************************************/

#include "common/logger.h"

namespace pipeline {

LogLevel Logger::current_level_ = LogLevel::INFO;
std::mutex Logger::mutex_;
std::string Logger::process_tag_;
std::ofstream Logger::log_file_;

} // namespace pipeline
