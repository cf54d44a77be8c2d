#ifndef __MS_AUTH_GATE__
#define __MS_AUTH_GATE__

#include "Headers.hpp"

namespace ms {
const string PASSWORD_PROMPT = "Password:";
const string AUTHENTICATED_BANNER = "WebREPL";

/**
 * @brief Per-session password check.  Starts in AWAITING_PASSWORD and moves
 * to AUTHENTICATED at most once; there is no way back.
 */
class AuthGate {
 public:
  enum State { AWAITING_PASSWORD, AUTHENTICATED };

  enum Result {
    // The password matched, or no password is configured.
    PASSWORD_ACCEPTED,
    // Wrong password, prompt again.
    PASSWORD_RETRY,
    // Wrong password, hang up.
    PASSWORD_DENIED,
  };

  AuthGate(const string& _password, AuthFailurePolicy _failurePolicy);

  /**
   * @brief Checks a submitted line.  Must only be called while
   * AWAITING_PASSWORD.
   */
  Result submit(const string& line);

  State getState() const { return state; }

  bool isAuthenticated() const { return state == AUTHENTICATED; }

  int getFailedAttempts() const { return failedAttempts; }

 protected:
  string password;
  AuthFailurePolicy failurePolicy;
  State state;
  int failedAttempts;

  bool matches(const string& candidate) const;
};
}  // namespace ms

#endif  // __MS_AUTH_GATE__
