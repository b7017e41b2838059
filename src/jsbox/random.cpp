#include <jsbox/context.h>

#include <chrono>
#include <random>
#include <climits>

#include <openssl/rand.h>

bool SecureRandom::Fill(uint8_t* buf, size_t len) {
  if (len > INT_MAX) return false;
  return RAND_bytes(buf, (int)len) == 1;
}

std::string GenerateSecret(RandomSource& source, bool* strong) {
  uint32_t words[kSecretWords];
  std::string ret;
  if (source.Fill(reinterpret_cast<uint8_t*>(words), sizeof(words))) {
    for (auto& i : words) ret += std::to_string(i);
    if (strong) *strong = true;
    return ret;
  }
  // weaker mode: predictable to anyone who knows roughly when the run started
  auto now = std::chrono::system_clock::now().time_since_epoch();
  std::mt19937_64 gen(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
  for (int i = 0; i < kSecretWords; i++) ret += std::to_string((uint32_t)gen());
  ret += std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
  if (strong) *strong = false;
  return ret;
}
