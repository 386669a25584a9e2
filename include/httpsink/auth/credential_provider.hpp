#ifndef HTTPSINK_AUTH_CREDENTIAL_PROVIDER_HPP
#define HTTPSINK_AUTH_CREDENTIAL_PROVIDER_HPP

#include "httpsink/errors.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace httpsink {

using Clock = std::chrono::steady_clock;

/// Injectable time source; tests substitute a fake clock.
using NowFunction = std::function<Clock::time_point()>;

// ─────────────────────────────────────────────────────────────────────────────
// AccessToken
// ─────────────────────────────────────────────────────────────────────────────

struct AccessToken {
    std::string value;
    Clock::time_point expires_at;
};

// ─────────────────────────────────────────────────────────────────────────────
// ITokenSource
// ─────────────────────────────────────────────────────────────────────────────
// Acquires a fresh token. now is the provider's current time, so expiry can
// be computed against the same clock the provider checks it with.

class ITokenSource {
public:
    virtual ~ITokenSource() = default;

    [[nodiscard]] virtual SinkResult<AccessToken> fetch_token(Clock::time_point now) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// CredentialProvider
// ─────────────────────────────────────────────────────────────────────────────
// Caches one bearer token for a writer. The first get_token() fetches lazily;
// later calls reuse the cached token until now >= expires_at, then fetch once.
//
// Not thread-safe: one provider per writer, used from the writer's thread.

class CredentialProvider {
public:
    explicit CredentialProvider(std::shared_ptr<ITokenSource> source, NowFunction now = {});

    [[nodiscard]] SinkResult<AccessToken> get_token();

    /// "Bearer <token>", refreshing first when needed.
    [[nodiscard]] SinkResult<std::string> authorization_header();

    [[nodiscard]] bool is_expired(const AccessToken& token) const;

    /// Forget the cached token; the next get_token() fetches.
    void invalidate() noexcept {
        cached_.reset();
    }

    [[nodiscard]] std::size_t refresh_count() const noexcept {
        return refresh_count_;
    }

    [[nodiscard]] bool has_cached_token() const noexcept {
        return cached_.has_value();
    }

private:
    std::shared_ptr<ITokenSource> source_;
    NowFunction now_;
    std::optional<AccessToken> cached_;
    std::size_t refresh_count_{0};
};

}  // namespace httpsink

#endif  // HTTPSINK_AUTH_CREDENTIAL_PROVIDER_HPP
