#pragma once

#include <string>

std::string lang_instruction(const std::string& lang);
std::string get_system_prompt(const std::string& lang);
std::string get_commit_msg_prompt(const std::string& lang);
