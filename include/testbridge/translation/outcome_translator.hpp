#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "testbridge/model/test_descriptor.hpp"
#include "testbridge/model/test_identity.hpp"

namespace testbridge::translation {

// Fixed mapping from framework result states to external outcomes.
// Every state needs an explicit entry; kNone is only the fallback.
auto OutcomeOf(model::ResultState state) -> model::TestOutcome;

// The error message reported for a finished test.
//
// Interactive hosts render messages in a variable-width font, so for
// Failure and Inconclusive results the caret lines pointing at a mismatch
// ("  ----^") are removed together with one of their two line separators.
// LF, CR and CRLF separators are treated alike. Returns nullopt for an
// absent message.
auto NormalizeMessage(
    const std::optional<std::string>& message, model::ResultState state,
    bool interactive_host) -> std::optional<std::string>;

// Removes exactly one trailing line ending (CRLF, LF or CR) from a chunk of
// captured console output. "X\n\n" becomes "X\n"; embedded line breaks are
// kept.
auto NormalizeOutputChunk(std::string_view text) -> std::string;

}  // namespace testbridge::translation
