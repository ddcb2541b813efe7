/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <string>

namespace zeroalign::collapse {

struct Verdict {
    std::string status;
    std::string code;
    std::string integrity_hash;
    bool zero_point{false};
    std::string message;
};

// Unit Zero confirmation for a collapse result. Only 0 is "ABSOLUTE NATURALNESS".
Verdict verdict(std::int64_t result);

} // namespace zeroalign::collapse
