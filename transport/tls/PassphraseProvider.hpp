/**
 * \file transport/tls/PassphraseProvider.hpp
 * \brief Sources for the passphrase of an encrypted private key.
 * \ingroup tls_module
 */
#pragma once

#include "config/Config.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace takclient::transport::tls {

/** \brief Supplies a key passphrase on demand; nullopt means "not available". */
class IPassphraseProvider {
public:
    virtual ~IPassphraseProvider() = default;
    virtual std::optional<std::string> passphrase(const std::string& prompt) = 0;
};

/** \brief `TAK_TLS_CLIENT_KEY_PASSWORD`, falling back to `TAK_TLS_CLIENT_PASSWORD`. */
class ConfigPassphraseProvider : public IPassphraseProvider {
public:
    explicit ConfigPassphraseProvider(const config::Config& cfg);
    std::optional<std::string> passphrase(const std::string& prompt) override;
private:
    std::optional<std::string> value_;
};

/** \brief Prompts on the controlling terminal with echo disabled; nullopt when stdin is not a tty. */
class InteractivePassphraseProvider : public IPassphraseProvider {
public:
    std::optional<std::string> passphrase(const std::string& prompt) override;
};

/** \brief First provider that answers wins. */
class ChainedPassphraseProvider : public IPassphraseProvider {
public:
    explicit ChainedPassphraseProvider(std::vector<std::shared_ptr<IPassphraseProvider>> providers)
        : providers_(std::move(providers)) {}
    std::optional<std::string> passphrase(const std::string& prompt) override;
private:
    std::vector<std::shared_ptr<IPassphraseProvider>> providers_;
};

} // namespace takclient::transport::tls
