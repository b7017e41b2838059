#ifndef INCLUDE_JSBOX_CONTEXT_H_
#define INCLUDE_JSBOX_CONTEXT_H_

#include <string>
#include <cstddef>
#include <cstdint>
#include <functional>

// Called with (context handle, raw message line). May be called from any thread.
using MessageHandler = std::function<void(long, const std::string&)>;

// Creates and tears down isolated execution contexts.
// Handles are positive and never reused by one factory.
class ContextFactory {
 public:
  virtual ~ContextFactory() {}
  // 0 if no context could be created
  virtual long Create() = 0;
  // Unknown handles are ignored; must not block on the program running inside
  virtual void Destroy(long handle) = 0;
  // Installs and starts a program, replacing whatever the context was running
  virtual bool Send(long handle, const std::string& program) = 0;
  // Replaces the handler for messages from every context of this factory; nullptr detaches
  virtual void OnMessage(MessageHandler handler) = 0;
};

struct SyntaxResult {
  bool valid;
  std::string name;  // e.g. "SyntaxError"
  std::string error; // parser message
  SyntaxResult() : valid(true) {}
  SyntaxResult(const std::string& name, const std::string& error) :
      valid(false), name(name), error(error) {}
  // "SyntaxError: Unexpected end of input"
  std::string ToString() const;
};

// Parses code without running it
class SyntaxChecker {
 public:
  virtual ~SyntaxChecker() {}
  virtual SyntaxResult Check(const std::string& code) = 0;
};

class RandomSource {
 public:
  virtual ~RandomSource() {}
  // false if the source cannot produce bytes right now
  virtual bool Fill(uint8_t* buf, size_t len) = 0;
};

// OpenSSL RAND_bytes
class SecureRandom : public RandomSource {
 public:
  bool Fill(uint8_t* buf, size_t len) override;
};

constexpr int kSecretWords = 2;

// Decimal concatenation of kSecretWords random 32-bit words. If the source fails, falls back to
// a clock-seeded non-cryptographic generator and sets *strong to false.
std::string GenerateSecret(RandomSource&, bool* strong = nullptr);

#endif  // INCLUDE_JSBOX_CONTEXT_H_
