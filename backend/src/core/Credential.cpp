#include "Credential.hpp"

#include <sodium.h>

void wipe(std::string& s) {
    if (!s.empty())
        sodium_memzero(&s[0], s.size());
    s.clear();
}

Credential::Credential(std::string acct, std::string sec)
    : account(std::move(acct)), secret(std::move(sec))
{
}

Credential::~Credential() {
    wipe(secret);
}

Credential::Credential(Credential&& other) noexcept
    : account(std::move(other.account)), secret(std::move(other.secret))
{
    wipe(other.secret);
}

Credential& Credential::operator=(Credential&& other) noexcept {
    if (this != &other) {
        wipe(secret);
        account = std::move(other.account);
        secret = std::move(other.secret);
        wipe(other.secret);
    }
    return *this;
}
