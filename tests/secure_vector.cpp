#include <doctest/doctest.h>
#include <cstring>
#include <string>
#include <vector>
#include "warden/secure_vector.hpp"

using namespace warden;

TEST_CASE("SecureAllocator: BasicAllocation") {
    SecureAllocator<uint8_t> allocator;

    auto ptr = allocator.allocate(1024);
    REQUIRE(ptr != nullptr);

    std::memset(ptr, 0xAA, 1024);
    CHECK(ptr[0] == 0xAA);
    CHECK(ptr[1023] == 0xAA);

    allocator.deallocate(ptr, 1024);
}

TEST_CASE("SecureAllocator: ZeroAllocation") {
    SecureAllocator<uint8_t> allocator;
    CHECK(allocator.allocate(0) == nullptr);
    allocator.deallocate(nullptr, 0);
}

TEST_CASE("SecureAllocator: SecureZero clears buffer") {
    std::vector<uint8_t> buffer(64, 0x5A);
    SecureAllocator<uint8_t>::secureZero(buffer.data(), buffer.size());
    for (auto b : buffer) {
        CHECK(b == 0);
    }
}

TEST_CASE("SecureVector: Holds key material") {
    SecureBytes key(32, 0x42);
    REQUIRE(key.size() == 32);
    CHECK(key.front() == 0x42);
    CHECK(key.back() == 0x42);

    key.resize(64, 0x01);
    CHECK(key[31] == 0x42);
    CHECK(key[63] == 0x01);
}

TEST_CASE("SecureUtils: constantTimeEqual on bytes") {
    std::vector<uint8_t> a = {1, 2, 3, 4};
    std::vector<uint8_t> b = {1, 2, 3, 4};
    std::vector<uint8_t> c = {1, 2, 3, 5};
    std::vector<uint8_t> shorter = {1, 2, 3};

    CHECK(secure_utils::constantTimeEqual(a, b));
    CHECK_FALSE(secure_utils::constantTimeEqual(a, c));
    CHECK_FALSE(secure_utils::constantTimeEqual(a, shorter));
}

TEST_CASE("SecureUtils: constantTimeEqual on strings") {
    CHECK(secure_utils::constantTimeEqual(std::string_view("abcdef"),
                                          std::string_view("abcdef")));
    CHECK_FALSE(secure_utils::constantTimeEqual(std::string_view("abcdef"),
                                                std::string_view("abcdeg")));
    CHECK(secure_utils::constantTimeEqual(std::string_view(),
                                          std::string_view()));
}

TEST_CASE("SecureUtils: toSecureBytes copies text") {
    auto bytes = secure_utils::toSecureBytes("key");
    REQUIRE(bytes.size() == 3);
    CHECK(bytes[0] == 'k');
    CHECK(bytes[2] == 'y');
}

TEST_CASE("SecureUtils: wipe empties string") {
    std::string secret = "do-not-keep-me";
    secure_utils::wipe(secret);
    CHECK(secret.empty());
}
