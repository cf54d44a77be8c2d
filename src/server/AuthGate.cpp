#include "AuthGate.hpp"

namespace ms {
AuthGate::AuthGate(const string& _password, AuthFailurePolicy _failurePolicy)
    : password(_password),
      failurePolicy(_failurePolicy),
      state(AWAITING_PASSWORD),
      failedAttempts(0) {}

AuthGate::Result AuthGate::submit(const string& line) {
  if (state == AUTHENTICATED) {
    STFATAL << "Password submitted to an authenticated session";
  }
  if (matches(line)) {
    state = AUTHENTICATED;
    return PASSWORD_ACCEPTED;
  }
  failedAttempts++;
  LOG(WARNING) << "Wrong password (attempt " << failedAttempts << ")";
  return failurePolicy == AUTH_DISCONNECT ? PASSWORD_DENIED : PASSWORD_RETRY;
}

bool AuthGate::matches(const string& candidate) const {
  if (password.empty()) {
    return true;
  }
  if (candidate.length() != password.length()) {
    return false;
  }
  return sodium_memcmp(candidate.data(), password.data(), password.length()) ==
         0;
}
}  // namespace ms
