#ifndef AUTHKIT_AUTH_USER_INTERACTION_H
#define AUTHKIT_AUTH_USER_INTERACTION_H

#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

/**
 * @file user_interaction.h
 * @brief Everything a login flow may need from a human
 *
 * Flows never touch the terminal or a browser directly; they go through
 * this interface so applications can route prompts into their own UI and
 * tests can script the answers.
 */

namespace authkit {

class UserInteraction {
 public:
  virtual ~UserInteraction() = default;

  // false when no browser could be launched
  virtual bool open_browser(const std::string& url) = 0;

  virtual std::string prompt(const std::string& message) = 0;

  // As prompt(), without echoing the answer
  virtual std::string prompt_secret(const std::string& message) = 0;

  /**
   * @brief Show a device authorization to the user
   * @param device_authorization Device authorization response
   *        (user_code, verification_uri, verification_uri_complete, ...)
   * @param display_qr_code Render verification_uri_complete as a QR code
   *        where the implementation supports it
   */
  virtual void present_device_code(const nlohmann::json& device_authorization,
                                   bool display_qr_code) = 0;

  virtual void notify(const std::string& message) = 0;
};

/**
 * @brief Terminal implementation
 *
 * Browsers are launched with xdg-open. QR codes are not rendered; the
 * complete verification URI is printed instead.
 */
class ConsoleUserInteraction : public UserInteraction {
 public:
  ConsoleUserInteraction(std::istream& in = std::cin,
                         std::ostream& out = std::cerr);

  bool open_browser(const std::string& url) override;
  std::string prompt(const std::string& message) override;
  std::string prompt_secret(const std::string& message) override;
  void present_device_code(const nlohmann::json& device_authorization,
                           bool display_qr_code) override;
  void notify(const std::string& message) override;

 private:
  std::istream& in_;
  std::ostream& out_;
};

}  // namespace authkit

#endif  // AUTHKIT_AUTH_USER_INTERACTION_H
