#include "codespaces/auth/credentials.hpp"

#include "codespaces/common/fs.hpp"

namespace codespaces::auth {

std::string missing_token_guidance() {
  return "No GitHub token provided.\n"
         "\n"
         "Please provide a token using one of these methods:\n"
         "1. Pass it as a parameter: codespaces --token YOUR_TOKEN\n"
         "2. Set it in your environment: export GITHUB_TOKEN=YOUR_TOKEN\n"
         "3. Create a .env file next to the codespaces executable with: GITHUB_TOKEN=YOUR_TOKEN\n"
         "\n"
         "Note: The token should be a 'Personal access token (classic)' with:\n"
         "  - 'codespace' permission enabled\n"
         "  - Authorization for any organization that owns your codespaces";
}

common::Result<std::string, api::Error>
resolve_token(const std::optional<std::string> &explicit_token, const config::Config &config) {
  using ResultT = common::Result<std::string, api::Error>;

  if (explicit_token.has_value() && !common::trim(*explicit_token).empty()) {
    return ResultT::success(common::trim(*explicit_token));
  }
  if (config.github_token.has_value() && !common::trim(*config.github_token).empty()) {
    return ResultT::success(common::trim(*config.github_token));
  }
  return ResultT::failure(api::Error{.kind = api::ErrorKind::MissingCredential,
                                     .status = 0,
                                     .body = "",
                                     .message = missing_token_guidance()});
}

} // namespace codespaces::auth
