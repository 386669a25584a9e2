#include "httpsink/auth/credential_provider.hpp"
#include "httpsink/log/logger.hpp"

namespace httpsink {

CredentialProvider::CredentialProvider(std::shared_ptr<ITokenSource> source, NowFunction now)
    : source_(std::move(source))
    , now_(now ? std::move(now) : NowFunction([] { return Clock::now(); }))
{}

bool CredentialProvider::is_expired(const AccessToken& token) const {
    return now_() >= token.expires_at;
}

SinkResult<AccessToken> CredentialProvider::get_token() {
    if (cached_.has_value() && (is_expired(*cached_) == false)) {
        return *cached_;
    }

    if (!source_) {
        return tl::unexpected(SinkError::configuration("No token source configured"));
    }

    HTTPSINK_LOG_DEBUG("auth", "Refreshing access token (refresh #{})", refresh_count_ + 1);

    auto fetched = source_->fetch_token(now_());
    ++refresh_count_;
    if (!fetched) {
        cached_.reset();
        return tl::unexpected(fetched.error());
    }

    cached_ = std::move(*fetched);
    return *cached_;
}

SinkResult<std::string> CredentialProvider::authorization_header() {
    auto token = get_token();
    if (!token) {
        return tl::unexpected(token.error());
    }
    return "Bearer " + token->value;
}

}  // namespace httpsink
