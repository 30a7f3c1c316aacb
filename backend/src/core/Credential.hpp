#pragma once
#include <string>

// Overwrites the buffer with zeros (sodium_memzero) and empties it.
void wipe(std::string& s);

// Account plus its password, held only for the duration of one call.
// The secret is wiped when the object goes away.
class Credential {
public:
    Credential() = default;
    Credential(std::string account, std::string secret);
    ~Credential();

    Credential(const Credential&) = delete;
    Credential& operator=(const Credential&) = delete;
    Credential(Credential&& other) noexcept;
    Credential& operator=(Credential&& other) noexcept;

    std::string account;
    std::string secret;
};
