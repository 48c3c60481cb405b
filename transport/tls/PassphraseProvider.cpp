/**
 * \file transport/tls/PassphraseProvider.cpp
 * \ingroup tls_module
 */
#include "PassphraseProvider.hpp"

#include <termios.h>
#include <unistd.h>

#include <iostream>

namespace takclient::transport::tls {

ConfigPassphraseProvider::ConfigPassphraseProvider(const config::Config& cfg) {
    value_ = cfg.get(config::keys::TlsClientKeyPassword);
    if (!value_ || value_->empty()) value_ = cfg.get(config::keys::TlsClientPassword);
    if (value_ && value_->empty()) value_.reset();
}

std::optional<std::string> ConfigPassphraseProvider::passphrase(const std::string&) {
    return value_;
}

std::optional<std::string> InteractivePassphraseProvider::passphrase(const std::string& prompt) {
    if (!::isatty(STDIN_FILENO)) return std::nullopt;

    termios saved{};
    bool restore = ::tcgetattr(STDIN_FILENO, &saved) == 0;
    if (restore) {
        termios quiet = saved;
        quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &quiet);
    }

    std::cerr << prompt << ": " << std::flush;
    std::string line;
    bool ok = static_cast<bool>(std::getline(std::cin, line));
    std::cerr << std::endl;

    if (restore) ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved);
    if (!ok) return std::nullopt;
    return line;
}

std::optional<std::string> ChainedPassphraseProvider::passphrase(const std::string& prompt) {
    for (auto& provider : providers_) {
        if (!provider) continue;
        if (auto value = provider->passphrase(prompt)) return value;
    }
    return std::nullopt;
}

} // namespace takclient::transport::tls
