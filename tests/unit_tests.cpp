#include "gtest/gtest.h"
#include "common/canonical_json.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "client/message_metadata.hpp"
#include "crypto/crypto_provider.hpp"
#include "crypto/hasher.hpp"
#include "crypto/identity_digest.hpp"
#include "crypto/signature.hpp"
#include "crypto/sm4_codec.hpp"
#include "network/http_client.hpp"
#include "network/protocol.hpp"
#include "test_fixtures.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

// --- Hasher ---

TEST(HasherTest, Sm3Vector) {
    std::vector<uint8_t> data = {'a', 'b', 'c'};
    ASSERT_EQ(Hasher::to_hex(Hasher::sm3(data)),
              "66C7F0F462EEEDD9D1F2D46BDC10E4E24167C4875CF2F7A2297DA02B8F4BA8E0");
}

TEST(HasherTest, Sm3StringMatchesVector) {
    ASSERT_EQ(Hasher::sm3(std::string("abc")), Hasher::sm3(std::vector<uint8_t>{'a', 'b', 'c'}));
}

TEST(HasherTest, HexConversion) {
    std::vector<uint8_t> bytes = Hasher::from_hex("00ff10Ab");
    ASSERT_EQ(bytes, (std::vector<uint8_t>{0x00, 0xFF, 0x10, 0xAB}));
    ASSERT_EQ(Hasher::to_hex(bytes), "00FF10AB");
    EXPECT_THROW(Hasher::from_hex("ABC"), std::invalid_argument);
    EXPECT_THROW(Hasher::from_hex("ZZ"), std::invalid_argument);
}

// --- Canonical encoding ---

TEST(CanonicalJsonTest, KeepsInsertionOrderWithoutWhitespace) {
    FieldMap map;
    map["zeta"] = "1";
    map["alpha"] = 2;
    map["nested"] = FieldMap::object();
    map["nested"]["b"] = nullptr;
    map["nested"]["a"] = true;
    map["list"] = {1, "x"};
    ASSERT_EQ(CanonicalJson::encode(map), R"({"zeta":"1","alpha":2,"nested":{"b":null,"a":true},"list":[1,"x"]})");
}

TEST(CanonicalJsonTest, EmitsRawUtf8) {
    FieldMap map;
    map["payAcctName"] = "温州银行";
    ASSERT_EQ(CanonicalJson::encode(map), "{\"payAcctName\":\"温州银行\"}");
}

TEST(CanonicalJsonTest, DecodeThenEncodeIsIdentity) {
    std::string text = R"({"b":"2","a":{"y":[true,null],"x":"1"},"c":-3})";
    ASSERT_EQ(CanonicalJson::encode(CanonicalJson::decode(text)), text);
}

TEST(CanonicalJsonTest, KeyOrderChangesBytes) {
    FieldMap ab;
    ab["a"] = "1";
    ab["b"] = "2";
    FieldMap ba;
    ba["b"] = "2";
    ba["a"] = "1";
    EXPECT_EQ(CanonicalJson::encode(ab), R"({"a":"1","b":"2"})");
    EXPECT_EQ(CanonicalJson::encode(ba), R"({"b":"2","a":"1"})");
    EXPECT_NE(CanonicalJson::encode(ab), CanonicalJson::encode(ba));
}

TEST(CanonicalJsonTest, EmptyMap) {
    ASSERT_EQ(CanonicalJson::encode(FieldMap::object()), "{}");
}

TEST(CanonicalJsonTest, RejectsInvalidInput) {
    FieldMap bad_utf8;
    bad_utf8["name"] = std::string("\xFF\xFE");
    EXPECT_THROW(CanonicalJson::encode(bad_utf8), EncodeError);
    EXPECT_THROW(CanonicalJson::encode(FieldMap::array()), EncodeError);

    EXPECT_THROW(CanonicalJson::decode(std::string("{\"a\":")), DecodeError);
    EXPECT_THROW(CanonicalJson::decode(std::string("[1,2]")), DecodeError);
    EXPECT_THROW(CanonicalJson::decode(std::vector<uint8_t>{'{', '"', 0xC3, '"', ':', '1', '}'}), DecodeError);
}

// --- SM4 codec ---

TEST(Sm4CodecTest, EncryptsFixtureBodies) {
    Sm4Codec codec(Fixture::SM4_KEY, Fixture::SM4_IV);
    ASSERT_EQ(codec.encrypt(Fixture::PLAIN_BODY), Fixture::PLAIN_BODY_CIPHER);
    ASSERT_EQ(codec.encrypt_body(CanonicalJson::decode(Fixture::BODY_WITH_METADATA)),
              Fixture::BODY_WITH_METADATA_CIPHER);
}

TEST(Sm4CodecTest, DecryptsFixtureBody) {
    Sm4Codec codec(Fixture::SM4_KEY, Fixture::SM4_IV);
    std::vector<uint8_t> plain = codec.decrypt(Fixture::PLAIN_BODY_CIPHER);
    ASSERT_EQ(std::string(plain.begin(), plain.end()), Fixture::PLAIN_BODY);
    // Lowercase hex is accepted on input.
    std::string lower = Fixture::BODY_WITH_METADATA_CIPHER;
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    ASSERT_EQ(CanonicalJson::encode(codec.decrypt_body(lower)), Fixture::BODY_WITH_METADATA);
}

TEST(Sm4CodecTest, BodyRoundTripKeepsValuesAndOrder) {
    Sm4Codec codec(Fixture::SM4_KEY, Fixture::SM4_IV);
    FieldMap body;
    body["payAcctName"] = "瓯江实验室";
    body["transAmt"] = "1024.50";
    body["count"] = 3;
    body["rate"] = 12.5;
    body["urgent"] = false;
    body["reserve1"] = nullptr;
    body["payee"] = FieldMap::object();
    body["payee"]["rcvAcctName"] = "温州银行";
    body["payee"]["tags"] = {"a", 2, true};
    body["items"] = FieldMap::array();

    FieldMap back = codec.decrypt_body(codec.encrypt_body(body));
    EXPECT_EQ(CanonicalJson::encode(back), CanonicalJson::encode(body));
    EXPECT_EQ(back["payAcctName"], "瓯江实验室");
    EXPECT_EQ(back["payee"]["rcvAcctName"], "温州银行");
    EXPECT_EQ(back["count"], 3);
    EXPECT_DOUBLE_EQ(back["rate"].get<double>(), 12.5);
    EXPECT_TRUE(back["reserve1"].is_null());
    EXPECT_EQ(back.begin().key(), "payAcctName");
}

TEST(Sm4CodecTest, BlockAlignedPlaintextGetsFullPaddingBlock) {
    Sm4Codec codec(Fixture::SM4_KEY, Fixture::SM4_IV);
    std::string sixteen(16, 'a');
    std::string cipher = codec.encrypt(sixteen);
    ASSERT_EQ(cipher.size(), 64u);
    std::vector<uint8_t> back = codec.decrypt(cipher);
    ASSERT_EQ(std::string(back.begin(), back.end()), sixteen);
}

TEST(Sm4CodecTest, RejectsMalformedCiphertext) {
    Sm4Codec codec(Fixture::SM4_KEY, Fixture::SM4_IV);
    EXPECT_THROW(codec.decrypt("XYZ1"), DecryptError);
    EXPECT_THROW(codec.decrypt("ABCD"), DecryptError);
    EXPECT_THROW(codec.decrypt(""), DecryptError);

    Sm4Codec other("00112233445566778899AABBCCDDEEFF", Fixture::SM4_IV);
    EXPECT_THROW(other.decrypt_body(Fixture::PLAIN_BODY_CIPHER), DecryptError);
}

TEST(Sm4CodecTest, RejectsBadKeyMaterial) {
    EXPECT_THROW(Sm4Codec("ABCD", Fixture::SM4_IV), ConfigError);
    EXPECT_THROW(Sm4Codec(Fixture::SM4_KEY, "not hex at all, no"), ConfigError);
    EXPECT_THROW(Sm4Codec(std::vector<uint8_t>(15), std::vector<uint8_t>(16)), ConfigError);
}

// --- Identity digest and SM2 ---

TEST(IdentityDigestTest, DerivesFixturePublicKeyAndZa) {
    std::vector<uint8_t> public_key = Sm2Signer::derive_public_key(Fixture::PRIVATE_KEY);
    ASSERT_EQ(Hasher::to_hex(public_key), Fixture::PUBLIC_KEY);
    ASSERT_EQ(Hasher::to_hex(IdentityDigest::compute(public_key)), Fixture::ZA);
}

TEST(IdentityDigestTest, AcceptsAllPublicKeyEncodings) {
    std::vector<uint8_t> full = Hasher::from_hex(Fixture::PUBLIC_KEY);
    std::vector<uint8_t> bare(full.begin() + 1, full.end());
    // Y ends in 0x40, so the compressed prefix is 02.
    std::vector<uint8_t> compressed(full.begin(), full.begin() + 33);
    compressed[0] = 0x02;

    ASSERT_EQ(IdentityDigest::normalize_public_key(full), bare);
    ASSERT_EQ(IdentityDigest::normalize_public_key(bare), bare);
    ASSERT_EQ(IdentityDigest::normalize_public_key(compressed), bare);
    ASSERT_EQ(Hasher::to_hex(IdentityDigest::compute(compressed)), Fixture::ZA);

    EXPECT_THROW(IdentityDigest::normalize_public_key(std::vector<uint8_t>(40, 1)), SignatureError);
}

TEST(IdentityDigestTest, DependsOnUserId) {
    std::vector<uint8_t> public_key = Hasher::from_hex(Fixture::PUBLIC_KEY);
    ASSERT_NE(IdentityDigest::compute(public_key, "ALICE123@YAHOO.COM"), IdentityDigest::compute(public_key));
}

TEST(SignatureTest, PinnedNonceReproducesFixture) {
    Sm2Signer signer(Fixture::PRIVATE_KEY, std::make_shared<FixedNonceSource>(Fixture::NONCE));
    ASSERT_EQ(Hasher::to_hex(signer.identity_digest()), Fixture::ZA);
    ASSERT_EQ(Hasher::to_hex(Sm2Verifier(Hasher::from_hex(Fixture::PUBLIC_KEY)).message_digest(Fixture::SIGNED_MESSAGE)),
              Fixture::MESSAGE_DIGEST);
    ASSERT_EQ(signer.sign(Fixture::SIGNED_MESSAGE), Fixture::SIGNATURE);
}

TEST(SignatureTest, SignatureIsDerSequenceOfTwoIntegers) {
    Sm2Signer signer(Fixture::PRIVATE_KEY);
    std::vector<uint8_t> der = Hasher::from_hex(signer.sign("payload"));
    ASSERT_GE(der.size(), 8u);
    ASSERT_EQ(der[0], 0x30);
    ASSERT_EQ(static_cast<size_t>(der[1]) + 2, der.size());
    ASSERT_EQ(der[2], 0x02);
    size_t r_len = der[3];
    ASSERT_EQ(der[4 + r_len], 0x02);
    size_t s_len = der[5 + r_len];
    ASSERT_EQ(6 + r_len + s_len, der.size());
}

TEST(SignatureTest, FreshNonceEachSignatureAndBothVerify) {
    Sm2Signer signer(Fixture::PRIVATE_KEY);
    Sm2Verifier verifier(Hasher::from_hex(Fixture::PUBLIC_KEY));
    std::string first = signer.sign(Fixture::SIGNED_MESSAGE);
    std::string second = signer.sign(Fixture::SIGNED_MESSAGE);
    ASSERT_NE(first, second);
    ASSERT_TRUE(verifier.verify(Fixture::SIGNED_MESSAGE, first));
    ASSERT_TRUE(verifier.verify(Fixture::SIGNED_MESSAGE, second));
}

TEST(SignatureTest, VerifiesFixtureAndRejectsTampering) {
    Sm2Verifier verifier(Hasher::from_hex(Fixture::PUBLIC_KEY));
    ASSERT_TRUE(verifier.verify(Fixture::SIGNED_MESSAGE, Fixture::SIGNATURE));

    std::string tampered_message = Fixture::SIGNED_MESSAGE;
    tampered_message[tampered_message.size() - 3] = 'B';
    ASSERT_FALSE(verifier.verify(tampered_message, Fixture::SIGNATURE));

    std::string tampered_signature = Fixture::SIGNATURE;
    tampered_signature.back() = 'C';
    ASSERT_FALSE(verifier.verify(Fixture::SIGNED_MESSAGE, tampered_signature));

    // Same signature under another identity tag.
    Sm2Verifier other_id(Hasher::from_hex(Fixture::PUBLIC_KEY), CurveParams::sm2p256v1(), "ALICE123@YAHOO.COM");
    ASSERT_FALSE(other_id.verify(Fixture::SIGNED_MESSAGE, Fixture::SIGNATURE));
}

TEST(SignatureTest, MalformedSignatureEncodingThrows) {
    Sm2Verifier verifier(Hasher::from_hex(Fixture::PUBLIC_KEY));
    EXPECT_THROW(verifier.verify("m", "not-hex"), SignatureError);
    EXPECT_THROW(verifier.verify("m", "3044"), SignatureError);
    EXPECT_THROW(verifier.verify("m", Fixture::SIGNATURE + "00"), SignatureError);
}

TEST(SignatureTest, RejectsOutOfRangePrivateKeys) {
    const std::string n = "FFFFFFFEFFFFFFFFFFFFFFFFFFFFFFFF7203DF6B21C6052B53BBF40939D54123";
    const std::string n_minus_1 = "FFFFFFFEFFFFFFFFFFFFFFFFFFFFFFFF7203DF6B21C6052B53BBF40939D54122";
    EXPECT_THROW(Sm2Signer("00"), ConfigError);
    EXPECT_THROW(Sm2Signer{n}, ConfigError);
    EXPECT_THROW(Sm2Signer{n_minus_1}, ConfigError);
    EXPECT_THROW(Sm2Signer("xyz"), ConfigError);
    EXPECT_THROW(Sm2Signer("-1"), ConfigError);
    EXPECT_THROW(Sm2Signer("-5"), ConfigError);
    EXPECT_THROW(Sm2Signer("-bf5e"), ConfigError);
    EXPECT_THROW(Sm2Signer("+5"), ConfigError);
    EXPECT_THROW(Sm2Signer::derive_public_key("-5"), ConfigError);
    EXPECT_NO_THROW(Sm2Signer("01"));
}

TEST(SignatureTest, RejectsNonceOutsideRange) {
    Sm2Signer zero_nonce(Fixture::PRIVATE_KEY, std::make_shared<FixedNonceSource>("00"));
    EXPECT_THROW(zero_nonce.sign("m"), SignatureError);
}

TEST(SignatureTest, ConcurrentSigningYieldsDistinctValidSignatures) {
    Sm2Signer signer(Fixture::PRIVATE_KEY);
    std::mutex mutex;
    std::vector<std::string> signatures;
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&]() {
            for (int i = 0; i < 8; ++i) {
                std::string sig = signer.sign(Fixture::SIGNED_MESSAGE);
                std::lock_guard<std::mutex> lock(mutex);
                signatures.push_back(sig);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    std::set<std::string> unique(signatures.begin(), signatures.end());
    ASSERT_EQ(unique.size(), 32u);
    for (const auto& sig : signatures) {
        ASSERT_TRUE(signer.verify(Fixture::SIGNED_MESSAGE, sig));
    }
}

TEST(CryptoProviderTest, RoundTripsThroughAllFourOperations) {
    KeyMaterial keys = Fixture::config().keys;
    SmCryptoProvider provider(keys);
    ASSERT_EQ(provider.encrypt(Fixture::PLAIN_BODY), Fixture::PLAIN_BODY_CIPHER);
    std::vector<uint8_t> plain = provider.decrypt(Fixture::PLAIN_BODY_CIPHER);
    ASSERT_EQ(std::string(plain.begin(), plain.end()), Fixture::PLAIN_BODY);
    ASSERT_TRUE(provider.verify(Fixture::SIGNED_MESSAGE, provider.sign(Fixture::SIGNED_MESSAGE)));
}

TEST(CryptoProviderTest, MissingKeyMaterial) {
    KeyMaterial keys = Fixture::config().keys;
    keys.sm4_iv.clear();
    EXPECT_THROW(SmCryptoProvider{keys}, ConfigError);

    keys = Fixture::config().keys;
    keys.sm2_bank_public_key = "04ABCD";
    EXPECT_THROW(SmCryptoProvider{keys}, ConfigError);

    keys = Fixture::config().keys;
    keys.sm2_bank_public_key.clear();
    SmCryptoProvider no_bank_key(keys);
    EXPECT_THROW(no_bank_key.verify(Fixture::SIGNED_MESSAGE, Fixture::SIGNATURE), ConfigError);
}

// --- Sign map ---

TEST(SignMapTest, SelectsAllowListedHeadersInSigningOrder) {
    HeaderList headers = {
        {HEADER_CONTENT_TYPE, CONTENT_TYPE_JSON},
        {HEADER_IDEMPOTENCY_KEY, "idem-1"},
        {HEADER_BANK_ID, "WZB"},
        {HEADER_APP_ID, Fixture::APP_ID},
        {HEADER_CUSTOMER_IP, ""},
        {"x-unrelated", "zzz"}
    };
    FieldMap sign_map = build_sign_map(headers, "CAFE");
    ASSERT_EQ(CanonicalJson::encode(sign_map),
              R"({"x-aob-appID":"bb800191-782c-41bc-920e-62f396008264","x-aob-bankID":"WZB",)"
              R"("x-idempotency-key":"idem-1","bizContent":"CAFE"})");
}

TEST(SignMapTest, CustomAllowListSkipsEmptyAndAbsent) {
    HeaderList headers = {{"a", ""}, {"b", "x"}, {"c", "y"}};
    FieldMap sign_map = build_sign_map(headers, {"a", "b", "c", "d"}, "BIZ");
    ASSERT_EQ(CanonicalJson::encode(sign_map), R"({"b":"x","c":"y","bizContent":"BIZ"})");
}

TEST(SignMapTest, NoHeadersAndNoBizContent) {
    ASSERT_EQ(CanonicalJson::encode(build_sign_map({}, "")), "{}");
    ASSERT_EQ(CanonicalJson::encode(build_sign_map({}, "AB")), R"({"bizContent":"AB"})");
}

TEST(SignMapTest, FixtureRequestSignMap) {
    HeaderList headers = {{HEADER_APP_ID, Fixture::APP_ID}, {HEADER_BANK_ID, "WZB"}};
    ASSERT_EQ(CanonicalJson::encode(build_sign_map(headers, Fixture::PLAIN_BODY_CIPHER)), Fixture::SIGNED_MESSAGE);
}

TEST(ProtocolTest, HeaderHelpers) {
    HeaderList headers = {{"Content-Type", "text/plain"}};
    set_header(headers, "Content-Type", "application/json");
    set_header(headers, "x-aob-signature", "SIG");
    ASSERT_EQ(headers.size(), 2u);
    ASSERT_EQ(headers[0].second, "application/json");
    ASSERT_EQ(find_header(headers, "content-type"), nullptr);
    ASSERT_NE(find_header_ci(headers, "X-AOB-SIGNATURE"), nullptr);
    ASSERT_EQ(*find_header_ci(headers, "X-AOB-SIGNATURE"), "SIG");
    ASSERT_EQ(CanonicalJson::encode(make_envelope_body("AB")), R"({"bizContent":"AB"})");
}

// --- Message metadata ---

TEST(MessageMetadataTest, ClockSourceFormats) {
    ClockMetadataSource source;
    MessageMetadata first = source.next();
    MessageMetadata second = source.next();
    ASSERT_EQ(first.mesg_id.size(), 32u);
    ASSERT_EQ(first.mesg_id.find_first_not_of("0123456789abcdef"), std::string::npos);
    ASSERT_NE(first.mesg_id, second.mesg_id);
    ASSERT_EQ(first.mesg_date.size(), 8u);
    ASSERT_EQ(first.mesg_time.size(), 9u);
    ASSERT_EQ(first.mesg_time.find_first_not_of("0123456789"), std::string::npos);
}

TEST(MessageMetadataTest, InjectsOnlyMissingFieldsAfterCallerKeys) {
    FieldMap body;
    body["payAcctNo"] = "733000120190056868";
    body["mesgDate"] = "20240101";
    MessageMetadata metadata{"318e8a918a184db9838f6700ad42f701", "20251202", "110608000"};
    ASSERT_EQ(inject_metadata(body, metadata), 2);
    ASSERT_EQ(CanonicalJson::encode(body),
              R"({"payAcctNo":"733000120190056868","mesgDate":"20240101",)"
              R"("mesgId":"318e8a918a184db9838f6700ad42f701","mesgTime":"110608000"})");
    ASSERT_EQ(inject_metadata(body, metadata), 0);
}

// --- Configuration ---

TEST(ConfigTest, DefaultsAndNormalization) {
    nlohmann::json j = {
        {"app_id", "app"},
        {"base_url", "https://gateway.test/api//"},
        {"keys", {{"sm2_private_key", Fixture::PRIVATE_KEY}, {"sm4_key", Fixture::SM4_KEY}, {"sm4_iv", Fixture::SM4_IV}}}
    };
    ClientConfig config = config_from_json(j);
    ASSERT_EQ(config.bank_id, "WZB");
    ASSERT_EQ(config.base_url, "https://gateway.test/api/");
    ASSERT_EQ(config.timeout.count(), 30);
    ASSERT_TRUE(config.verify_response_signature);
    ASSERT_FALSE(config.require_response_signature);
    ASSERT_TRUE(config.inject_message_metadata);
    ASSERT_TRUE(config.keys.sm2_bank_public_key.empty());
}

TEST(ConfigTest, RejectsMissingOrInvalidValues) {
    nlohmann::json keys = {{"sm2_private_key", Fixture::PRIVATE_KEY}, {"sm4_key", Fixture::SM4_KEY}, {"sm4_iv", Fixture::SM4_IV}};
    EXPECT_THROW(config_from_json({{"keys", keys}}), ConfigError);
    EXPECT_THROW(config_from_json({{"app_id", "app"}}), ConfigError);
    EXPECT_THROW(config_from_json({{"app_id", "app"}, {"keys", keys}, {"timeout_seconds", "soon"}}), ConfigError);
    EXPECT_THROW(config_from_json({{"app_id", "app"}, {"keys", keys}, {"timeout_seconds", 0}}), ConfigError);
    EXPECT_THROW(config_from_json(nlohmann::json::array()), ConfigError);
}

TEST(ConfigTest, LoadsFromFile) {
    fs::path path = fs::temp_directory_path() / "wzbank_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"app_id":"app","bank_id":"XYZ","timeout_seconds":5,"debug":true,)"
            << R"("require_response_signature":true,"keys":{"sm2_private_key":")" << Fixture::PRIVATE_KEY
            << R"(","sm2_bank_public_key":")" << Fixture::PUBLIC_KEY
            << R"(","sm4_key":")" << Fixture::SM4_KEY << R"(","sm4_iv":")" << Fixture::SM4_IV << R"("}})";
    }
    ClientConfig config = load_config(path.string());
    ASSERT_EQ(config.bank_id, "XYZ");
    ASSERT_EQ(config.timeout.count(), 5);
    ASSERT_TRUE(config.debug);
    ASSERT_TRUE(config.require_response_signature);
    ASSERT_EQ(config.base_url, "https://openapi.wzbank.cn/prdApiGW/");
    ASSERT_EQ(config.keys.sm2_bank_public_key, Fixture::PUBLIC_KEY);
    fs::remove(path);

    EXPECT_THROW(load_config((fs::temp_directory_path() / "wzbank_missing.json").string()), ConfigError);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(load_config(path.string()), ConfigError);
    fs::remove(path);
}

// --- HTTP framing ---

TEST(HttpTest, ParsesUrls) {
    Url url = parse_url("https://openapi.wzbank.cn/prdApiGW/V1/P01502/S01/queryeaccountbalance");
    ASSERT_TRUE(url.tls);
    ASSERT_EQ(url.host, "openapi.wzbank.cn");
    ASSERT_EQ(url.port, 443);
    ASSERT_EQ(url.target, "/prdApiGW/V1/P01502/S01/queryeaccountbalance");

    Url plain = parse_url("http://localhost:8080");
    ASSERT_FALSE(plain.tls);
    ASSERT_EQ(plain.port, 8080);
    ASSERT_EQ(plain.target, "/");

    EXPECT_THROW(parse_url("ftp://host/x"), TransportError);
    EXPECT_THROW(parse_url("https://host:99999/x"), TransportError);
    EXPECT_THROW(parse_url("https:///x"), TransportError);
}

TEST(HttpTest, BuildsRequest) {
    HttpRequest request;
    request.headers = {{HEADER_CONTENT_TYPE, CONTENT_TYPE_JSON}, {HEADER_SIGNATURE, "SIG"}};
    request.body = "{}";
    std::string wire = build_http_request(parse_url("http://localhost:8080/api/x"), request);
    ASSERT_EQ(wire,
              "POST /api/x HTTP/1.1\r\n"
              "Host: localhost:8080\r\n"
              "Content-Type: application/json\r\n"
              "x-aob-signature: SIG\r\n"
              "Content-Length: 2\r\n"
              "Connection: close\r\n\r\n{}");
}

TEST(HttpTest, ParsesContentLengthResponse) {
    HttpResponse response = parse_http_response(
        "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nX-AOB-Signature:  ABC \r\n"
        "Content-Length: 2\r\n\r\n{}trailing");
    ASSERT_EQ(response.status, 200);
    ASSERT_TRUE(response.ok());
    ASSERT_EQ(response.body, "{}");
    ASSERT_EQ(*find_header_ci(response.headers, HEADER_SIGNATURE), "ABC");
}

TEST(HttpTest, ParsesChunkedResponse) {
    HttpResponse response = parse_http_response(
        "HTTP/1.1 500 Internal Server Error\r\nTransfer-Encoding: chunked\r\n\r\n"
        "4\r\nWiki\r\n5;ext=1\r\npedia\r\n0\r\n\r\n");
    ASSERT_EQ(response.status, 500);
    ASSERT_FALSE(response.ok());
    ASSERT_EQ(response.body, "Wikipedia");
}

TEST(HttpTest, TruncatedStreamNeedsLengthFraming) {
    EXPECT_THROW(parse_http_response("HTTP/1.1 200 OK\r\n\r\n{\"bizCont", false), TransportError);
    HttpResponse framed = parse_http_response(
        "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\n{}", false);
    EXPECT_EQ(framed.body, "{}");
    HttpResponse unframed = parse_http_response("HTTP/1.1 200 OK\r\n\r\n{}");
    EXPECT_EQ(unframed.body, "{}");
}

TEST(HttpTest, RejectsMalformedResponses) {
    EXPECT_THROW(parse_http_response("HTTP/1.1 200 OK\r\n"), TransportError);
    EXPECT_THROW(parse_http_response("SMTP 220\r\n\r\n"), TransportError);
    EXPECT_THROW(parse_http_response("HTTP/1.1 2\r\n\r\n"), TransportError);
    EXPECT_THROW(parse_http_response("HTTP/1.1 200 OK\r\nbroken\r\n\r\n"), TransportError);
    EXPECT_THROW(parse_http_response("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc"), TransportError);
    EXPECT_THROW(parse_http_response("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nZZ\r\n"), TransportError);
}
