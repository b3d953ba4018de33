// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file template_error.hpp
 * @brief Error information shared by planning, catalog and export services
 */

#pragma once

#include "services/planning/fenestration.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace graft_template::services {

/**
 * @brief Existing registry entry that blocked an add request
 */
struct ConflictingEntry {
    std::size_t index = 0;
    Fenestration fenestration;
};

/**
 * @brief Error information for template planning and export operations
 *
 * All errors are recoverable: the operation that produced one left the
 * session unchanged.
 */
struct TemplateError {
    enum class Code {
        Success,
        InvalidParameter,
        SpacingConflict,
        IndexOutOfRange,
        RenderingFailed,
        FileCreationFailed,
        InternalError
    };

    Code code = Code::Success;
    std::string message;

    /// Set for SpacingConflict only
    std::optional<ConflictingEntry> conflict;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::InvalidParameter: return "Invalid parameter: " + message;
            case Code::SpacingConflict: return "Spacing conflict: " + message;
            case Code::IndexOutOfRange: return "Index out of range: " + message;
            case Code::RenderingFailed: return "Rendering failed: " + message;
            case Code::FileCreationFailed: return "File creation failed: " + message;
            case Code::InternalError: return "Internal error: " + message;
        }
        return "Unknown error";
    }
};

}  // namespace graft_template::services
