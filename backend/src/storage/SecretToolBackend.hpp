#pragma once
#include "SecretBackend.hpp"

#include <string>
#include <vector>

// Stores secrets in the freedesktop Secret Service through libsecret's
// `secret-tool` utility. Items carry the attributes service=<ns> account=<a>.
class SecretToolBackend : public SecretBackend {
public:
    explicit SecretToolBackend(std::string tool = "secret-tool");

    void add(const std::string& account, const std::string& secret) override;
    std::optional<std::string> find(const std::string& account) override;
    bool remove(const std::string& account) override;
    bool exists(const std::string& account) override;

    const char* name() const override { return "secret-tool"; }

private:
    std::string tool_;

    std::vector<std::string> attributes(const std::string& account) const;
};
