#pragma once
#include <cstdint>

namespace errc
{

// Outcome of a pipeline step. Results travel through out-parameters.
enum class Code : std::uint8_t
{
    ok = 0,
    validation,           // oversized or malformed producer input
    user_cancelled,       // signer or wallet declined the request
    service_unavailable,  // signing service unreachable
    wrong_recipient,      // ciphertext not addressed to the caller
    insufficient_budget,  // ledger resource budget exhausted
    relay_rejected,       // ledger refused the transaction
    retrieval,            // history fetch failed (retryable)
    parse,                // malformed record or plaintext
    incomplete_session,   // fragment set still has gaps
    integrity,            // hash mismatch after decryption
};

enum class Category : std::uint8_t
{
    None,
    Validation,
    Service,
    Broadcast,
    Retrieval,
    Parse,
    IncompleteSession,
    Integrity,
};

// user_cancelled is shared by signing and broadcast; callers that care which
// step failed know it from where the code came from. Taken alone it counts as
// a service error.
constexpr Category category(Code c)
{
    switch (c)
    {
        case Code::ok:
            return Category::None;
        case Code::validation:
            return Category::Validation;
        case Code::user_cancelled:
        case Code::service_unavailable:
        case Code::wrong_recipient:
            return Category::Service;
        case Code::insufficient_budget:
        case Code::relay_rejected:
            return Category::Broadcast;
        case Code::retrieval:
            return Category::Retrieval;
        case Code::parse:
            return Category::Parse;
        case Code::incomplete_session:
            return Category::IncompleteSession;
        case Code::integrity:
            return Category::Integrity;
    }
    return Category::None;
}

// Failures the caller may retry as-is (ledger or service came back later,
// or more history may complete a session).
constexpr bool retryable(Code c)
{
    return c == Code::service_unavailable || c == Code::retrieval ||
           c == Code::incomplete_session || c == Code::relay_rejected ||
           c == Code::insufficient_budget || c == Code::integrity;
}

inline const char *name(Code c)
{
    switch (c)
    {
        case Code::ok:
            return "ok";
        case Code::validation:
            return "validation";
        case Code::user_cancelled:
            return "user_cancelled";
        case Code::service_unavailable:
            return "service_unavailable";
        case Code::wrong_recipient:
            return "wrong_recipient";
        case Code::insufficient_budget:
            return "insufficient_budget";
        case Code::relay_rejected:
            return "relay_rejected";
        case Code::retrieval:
            return "retrieval";
        case Code::parse:
            return "parse";
        case Code::incomplete_session:
            return "incomplete_session";
        case Code::integrity:
            return "integrity";
    }
    return "?";
}

}  // namespace errc
