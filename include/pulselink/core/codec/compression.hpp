#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <utility>

#include "pulselink/core/codec/concepts.hpp"


namespace pulselink::core::codec {

namespace compression {

// -----------------------------------------------------------------------------
// PolicyConcept
//
// Optional transform applied to wire text: compress() after encode,
// decompress() before decode. decompress() returns false on corrupt input.
// -----------------------------------------------------------------------------
template<class P>
concept PolicyConcept =
    requires(P p, std::string& text, std::string_view in, std::string& out) {
        { p.compress(text) } -> std::same_as<void>;
        { p.decompress(in, out) } -> std::same_as<bool>;
    };

// Identity policy (default)
struct None {
    inline void compress(std::string&) const noexcept {
    }

    [[nodiscard]]
    inline bool decompress(std::string_view in, std::string& out) const {
        out.assign(in);
        return true;
    }
};

static_assert(PolicyConcept<None>);

} // namespace compression


// -----------------------------------------------------------------------------
// Compressed
//
// Wraps a codec with a compression policy. Satisfies CodecConcept.
// -----------------------------------------------------------------------------
template<CodecConcept Codec, compression::PolicyConcept Policy = compression::None>
class Compressed {
public:
    Compressed() = default;

    Compressed(Codec codec, Policy policy)
        : codec_(std::move(codec))
        , policy_(std::move(policy)) {
    }

    [[nodiscard]]
    inline std::string encode(const Frame& frame) {
        std::string text = codec_.encode(frame);
        policy_.compress(text);
        return text;
    }

    [[nodiscard]]
    inline Result decode(std::string_view bytes, Frame& out) {
        if (!policy_.decompress(bytes, scratch_)) {
            return Result::InvalidJson;
        }
        return codec_.decode(scratch_, out);
    }

    [[nodiscard]]
    inline Result check_payload(std::string_view payload) {
        return codec_.check_payload(payload);
    }

    [[nodiscard]]
    inline Codec& codec() noexcept {
        return codec_;
    }

private:
    Codec codec_{};
    Policy policy_{};
    std::string scratch_;
};

} // namespace pulselink::core::codec
