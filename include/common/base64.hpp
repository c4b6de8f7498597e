#pragma once

#include <string>

namespace arbiter {

std::string base64_encode(const std::string &data);

/**
 * @throw std::invalid_argument data 不是合法的 base64
 */
std::string base64_decode(const std::string &data);

}  // namespace arbiter
