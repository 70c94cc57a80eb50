#ifndef PROTECTIONCLASS_HPP
#define PROTECTIONCLASS_HPP

#include <optional>
#include <string>

/**
 * @brief When the content of a file may be accessed
 *
 * - Complete: only while the device is unlocked
 * - CompleteUnlessOpen: files already open stay readable after locking
 * - CompleteUntilFirstUserAuthentication: readable from the first unlock
 *   after boot onwards, including by processes restarted while locked
 * - None: always accessible
 */
enum class ProtectionClass {
  Complete,
  CompleteUnlessOpen,
  CompleteUntilFirstUserAuthentication,
  None
};

inline std::string protectionClassName(ProtectionClass cls) {
  switch (cls) {
  case ProtectionClass::Complete:
    return "complete";
  case ProtectionClass::CompleteUnlessOpen:
    return "complete-unless-open";
  case ProtectionClass::CompleteUntilFirstUserAuthentication:
    return "complete-until-first-auth";
  case ProtectionClass::None:
    return "none";
  }
  return "none";
}

inline std::optional<ProtectionClass>
protectionClassFromName(const std::string &name) {
  if (name == "complete")
    return ProtectionClass::Complete;
  if (name == "complete-unless-open")
    return ProtectionClass::CompleteUnlessOpen;
  if (name == "complete-until-first-auth")
    return ProtectionClass::CompleteUntilFirstUserAuthentication;
  if (name == "none")
    return ProtectionClass::None;
  return std::nullopt;
}

#endif // PROTECTIONCLASS_HPP
