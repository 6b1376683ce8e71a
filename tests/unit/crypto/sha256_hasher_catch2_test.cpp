#include <fstream>
#include <string>

#include <catch2/catch_test_macros.hpp>

#include <ragcore/crypto/hasher.h>
#include "support/temp_dir_scope.hpp"

using namespace ragcore;
using namespace ragcore::crypto;

TEST_CASE("SHA256Hasher: known vectors", "[unit][crypto]") {
    CHECK(SHA256Hasher::hashText("") ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(SHA256Hasher::hashText("abc") ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(SHA256Hasher::hashText("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
          "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST_CASE("SHA256Hasher: streaming matches one-shot", "[unit][crypto]") {
    const std::string text = "The quick brown fox jumps over the lazy dog";

    SHA256Hasher hasher;
    hasher.init();
    hasher.update(std::string_view(text).substr(0, 10));
    hasher.update(std::string_view(text).substr(10));
    CHECK(hasher.finalize() == SHA256Hasher::hashText(text));

    auto viaFactory = createSHA256Hasher();
    viaFactory->init();
    viaFactory->update(std::string_view(text));
    CHECK(viaFactory->finalize() ==
          "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592");
}

TEST_CASE("SHA256Hasher: file hashing", "[unit][crypto]") {
    auto dir = ragcore::test_support::TempDirScope::unique_under("ragcore-sha");
    const auto path = dir.file("doc.txt");
    {
        std::ofstream out(path, std::ios::binary);
        out << "abc";
    }

    SHA256Hasher hasher;
    auto hashed = hasher.hashFile(path);
    REQUIRE(hashed.has_value());
    CHECK(hashed.value() == SHA256Hasher::hashText("abc"));

    auto missing = hasher.hashFile(dir.file("nope.txt"));
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == ErrorCode::NotFound);
}
