#pragma once

#include "httpsink/auth/credential_provider.hpp"
#include "httpsink/http/http_client.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace httpsink {

struct OAuth2Config {
    std::string token_url;
    std::string client_id;
    std::string client_secret;
    std::string refresh_token;
    std::string scopes;  // Space-separated, optional
};

// ─────────────────────────────────────────────────────────────────────────────
// OAuth2TokenSource
// ─────────────────────────────────────────────────────────────────────────────
// Refresh-token grant. POSTs a form-encoded body to the token URL and reads
// "access_token" and "expires_in" from the JSON reply. A missing expires_in
// means one hour.

class OAuth2TokenSource final : public ITokenSource {
public:
    static constexpr std::chrono::seconds kDefaultExpiresIn{3600};

    OAuth2TokenSource(OAuth2Config config, std::shared_ptr<IHttpClient> http_client);

    [[nodiscard]] SinkResult<AccessToken> fetch_token(Clock::time_point now) override;

    /// Form body of the token request.
    [[nodiscard]] SinkResult<std::string> request_body() const;

private:
    OAuth2Config config_;
    std::shared_ptr<IHttpClient> http_client_;
};

}  // namespace httpsink
