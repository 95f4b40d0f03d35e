#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "openssl/evp.h"

class Hasher
{
public:
	enum class Type {
		SHA256 = 0,
		SHA512
	};

	struct Error {
		int code;
		std::string message;
	};

public:
	// Can be moved, but can't be copied
	Hasher(const Hasher&) = delete;
	Hasher& operator=(const Hasher&) = delete;
	Hasher(Hasher&&) noexcept;
	Hasher& operator=(Hasher&&) noexcept;

public:
	explicit Hasher(Type type);
	~Hasher();

public:
	Type GetType() const noexcept;

	// Starts (or restarts) a digest. Must be called before Update().
	std::optional<Error> Initialize() noexcept;
	std::optional<Error> Update(const char* buffer, const size_t size) noexcept;
	std::optional<Error> Update(std::string_view data) noexcept;
	std::tuple<bool, std::vector<uint8_t>, Error> Finalize() noexcept;

public:
	static std::string ToHex(const std::vector<uint8_t>& digest);

private:
	Type type_;
	const EVP_MD* md_;
	EVP_MD_CTX *ctx_;
};
