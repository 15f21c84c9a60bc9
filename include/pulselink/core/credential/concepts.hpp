#pragma once

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>


namespace pulselink::core::credential {

// Outcome of one credential lookup
enum class Status : std::uint8_t {
    Ready,        // token written to the output argument
    Pending,      // lookup in progress; ask again later
    Unavailable   // no session; the attempt must be aborted
};

[[nodiscard]]
inline constexpr std::string_view to_string(Status s) noexcept {
    switch (s) {
        case Status::Ready:       return "Ready";
        case Status::Pending:     return "Pending";
        case Status::Unavailable: return "Unavailable";
        default:                  return "Unknown";
    }
}

// -----------------------------------------------------------------------------
// ProviderConcept
// -----------------------------------------------------------------------------
//
// Supplies the access token embedded in the connect URL. Consulted once per
// connection attempt; a provider backed by an asynchronous source returns
// Pending until the token is available and is then polled again by the
// state machine (bounded by the connect timeout).
//
// -----------------------------------------------------------------------------
template<class P>
concept ProviderConcept =
    requires(P p, std::string& token) {
        { p.access_token(token) } -> std::same_as<Status>;
    };


// Provider holding a fixed token (examples, services with static keys)
class StaticProvider {
public:
    explicit StaticProvider(std::string token)
        : token_(std::move(token)) {
    }

    [[nodiscard]]
    inline Status access_token(std::string& out) const {
        if (token_.empty()) {
            return Status::Unavailable;
        }
        out = token_;
        return Status::Ready;
    }

    inline void set_token(std::string token) {
        token_ = std::move(token);
    }

private:
    std::string token_;
};

static_assert(ProviderConcept<StaticProvider>);

} // namespace pulselink::core::credential
