#pragma once

namespace ipsec {

// Whether diagnostic output may contain key material.
enum class SecretDisclosure {
    Redacted,
    Revealed
};

// Build default, controlled by the IPSEC_DEBUGGABLE option.
[[nodiscard]] constexpr SecretDisclosure defaultSecretDisclosure() noexcept {
#ifdef IPSEC_DEBUGGABLE
    return SecretDisclosure::Revealed;
#else
    return SecretDisclosure::Redacted;
#endif
}

}
