#include "StorageTestSupport.hpp"
#include "codec/Codec.hpp"
#include "media/Image.hpp"

#include <cstdint>
#include <iterator>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace stdfs = std::filesystem;
using namespace stash;
using namespace stash::storage;
using stash::test::expectError;

namespace {

struct Profile {
    std::string name;
    int age = 0;
    std::vector<std::string> tags;
    double score = 0.0;

    bool operator==(const Profile&) const = default;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Profile, name, age, tags, score)

media::Image gradient(const int width, const int height) {
    media::Image image{.width = width, .height = height, .channels = 3};
    image.pixels.resize(image.expectedSize());
    for (int y = 0; y < height; ++y)
        for (int x = 0; x < width; ++x) {
            auto* px = &image.pixels[(static_cast<size_t>(y) * width + x) * 3];
            px[0] = static_cast<uint8_t>(x * 16);
            px[1] = static_cast<uint8_t>(y * 32);
            px[2] = 128;
        }
    return image;
}

}

class EngineTest : public stash::test::StorageTest {};

TEST_F(EngineTest, ConstructionCreatesProtectedFolder) {
    const Engine engine(options("Profiles"));

    EXPECT_EQ(engine.folder(), root / "Profiles");
    ASSERT_TRUE(stdfs::is_directory(engine.folder()));
    EXPECT_EQ(stdfs::status(engine.folder()).permissions() & stdfs::perms::all, stdfs::perms::owner_all);
}

TEST_F(EngineTest, AppIdentifierAddsPathSegment) {
    auto o = options("Profiles");
    o.appIdentifier = "com.example.app";
    const Engine engine(std::move(o));
    EXPECT_EQ(engine.folder(), root / "com.example.app" / "Profiles");
    EXPECT_EQ(engine.filePath("k"), root / "com.example.app" / "Profiles" / "k");
}

TEST_F(EngineTest, RepeatedConstructionKeepsContents) {
    {
        Engine engine(options());
        engine.save(std::string("kept"), "k");
    }
    Engine again(options());
    EXPECT_EQ(again.load<std::string>("k"), "kept");
}

TEST_F(EngineTest, StructRoundTripsWarmAndCold) {
    const Profile p{"Ada", 36, {"math", "engines"}, 0.5};

    Engine engine(options());
    engine.save(p, "ada");
    EXPECT_EQ(engine.load<Profile>("ada"), p);

    Engine fresh(options());
    EXPECT_EQ(fresh.load<Profile>("ada"), p);
    EXPECT_EQ(fresh.memoryCache().stats().misses, 1u);
    EXPECT_EQ(fresh.load<Profile>("ada"), p);
    EXPECT_EQ(fresh.memoryCache().stats().hits, 1u);
}

TEST_F(EngineTest, ScalarsAreWrappedUnderStrictJson) {
    Engine engine(options());
    engine.save(42, "int");
    engine.save(std::string("x"), "str");
    engine.save(true, "flag");

    std::ifstream in(engine.filePath("int"));
    const std::string onDisk((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(nlohmann::json::parse(onDisk), (nlohmann::json{{"object", 42}}));

    Engine fresh(options());
    EXPECT_EQ(fresh.load<int>("int"), 42);
    EXPECT_EQ(fresh.load<std::string>("str"), "x");
    EXPECT_TRUE(fresh.load<bool>("flag"));
}

TEST_F(EngineTest, ContainersRoundTrip) {
    const std::map<std::string, std::vector<int>> m{{"a", {1, 2}}, {"object", {3}}};
    Engine engine(options());
    engine.save(m, "m");

    Engine fresh(options());
    EXPECT_EQ((fresh.load<std::map<std::string, std::vector<int>>>("m")), m);
}

TEST_F(EngineTest, BinaryCodecStoresScalarsDirectly) {
    auto o = options();
    o.codec = codec::makeCodec("cbor");
    Engine engine(o);
    engine.save(42, "n");

    std::ifstream in(engine.filePath("n"), std::ios::binary);
    const std::vector<uint8_t> onDisk((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(onDisk, nlohmann::json::to_cbor(42));

    Engine fresh(std::move(o));
    EXPECT_EQ(fresh.load<int>("n"), 42);
}

TEST_F(EngineTest, CachedValueSurvivesCorruptedFile) {
    Engine engine(options());
    engine.save(std::string("original"), "k");
    writeRaw(engine.filePath("k"), "garbage");

    EXPECT_EQ(engine.load<std::string>("k"), "original");

    Engine fresh(options());
    expectError([&] { (void)fresh.load<std::string>("k"); }, ErrorCode::DecodeData);
}

TEST_F(EngineTest, ExistsFollowsDiskState) {
    Engine engine(options());
    EXPECT_FALSE(engine.exists("k"));

    engine.save(1, "k");
    EXPECT_TRUE(engine.exists("k"));

    engine.remove("k");
    EXPECT_FALSE(engine.exists("k"));
}

TEST_F(EngineTest, ExistsIgnoresCache) {
    Engine engine(options());
    engine.save(1, "k");
    stdfs::remove(engine.filePath("k"));
    EXPECT_FALSE(engine.exists("k"));
}

TEST_F(EngineTest, MissingKeyIsNotFound) {
    Engine engine(options());
    EXPECT_FALSE(engine.exists("never"));
    expectError([&] { (void)engine.load<int>("never"); }, ErrorCode::NotFound);
    expectError([&] { (void)engine.loadImage("never"); }, ErrorCode::NotFound);
}

TEST_F(EngineTest, RemoveEvictsCachedValue) {
    Engine engine(options());
    engine.save(std::string("v"), "k");
    engine.remove("k");

    EXPECT_FALSE(engine.memoryCache().contains("k"));
    expectError([&] { (void)engine.load<std::string>("k"); }, ErrorCode::NotFound);
}

TEST_F(EngineTest, RemovingMissingKeyIsRemoveError) {
    Engine engine(options());
    expectError([&] { engine.remove("ghost"); }, ErrorCode::Remove);
}

TEST_F(EngineTest, RemoveAllLeavesWorkingEmptyFolder) {
    Engine engine(options());
    engine.save(1, "a");
    engine.save(2, "b");
    writeRaw(engine.folder() / "stray", "x");

    engine.removeAll();

    EXPECT_FALSE(engine.exists("a"));
    EXPECT_FALSE(engine.exists("b"));
    EXPECT_EQ(engine.memoryCache().size(), 0u);
    ASSERT_TRUE(stdfs::is_directory(engine.folder()));
    EXPECT_TRUE(stdfs::is_empty(engine.folder()));
    EXPECT_EQ(stdfs::status(engine.folder()).permissions() & stdfs::perms::all, stdfs::perms::owner_all);

    engine.save(3, "c");
    EXPECT_EQ(engine.load<int>("c"), 3);
}

TEST_F(EngineTest, FoldersAreIsolated) {
    Engine a(options("A"));
    Engine b(options("B"));
    a.save(1, "k");

    EXPECT_FALSE(b.exists("k"));
    b.removeAll();
    EXPECT_EQ(a.load<int>("k"), 1);
}

TEST_F(EngineTest, CachedTypeMismatchFallsThroughToDisk) {
    Engine engine(options());
    engine.save(42, "k");

    expectError([&] { (void)engine.load<std::string>("k"); }, ErrorCode::DecodeData);
    EXPECT_EQ(engine.memoryCache().stats().type_mismatches, 1u);
    EXPECT_EQ(engine.load<int>("k"), 42);
}

TEST_F(EngineTest, NumericKindMismatchOnDiskIsDecodeError) {
    {
        Engine engine(options());
        engine.save(true, "flag");
        engine.save(3.7, "ratio");
        engine.save(300, "count");
    }

    Engine fresh(options());
    expectError([&] { (void)fresh.load<int>("flag"); }, ErrorCode::DecodeData);
    expectError([&] { (void)fresh.load<int>("ratio"); }, ErrorCode::DecodeData);
    expectError([&] { (void)fresh.load<uint8_t>("count"); }, ErrorCode::DecodeData);
    EXPECT_EQ(fresh.memoryCache().size(), 0u);

    EXPECT_TRUE(fresh.load<bool>("flag"));
    EXPECT_DOUBLE_EQ(fresh.load<double>("ratio"), 3.7);
    EXPECT_EQ(fresh.load<int>("count"), 300);
}

TEST_F(EngineTest, NonFiniteValueIsEncodeError) {
    Engine engine(options());
    expectError([&] { engine.save(std::numeric_limits<double>::quiet_NaN(), "nan"); }, ErrorCode::EncodeData);
    EXPECT_FALSE(engine.exists("nan"));
}

TEST_F(EngineTest, ImageRoundTripKeepsDimensions) {
    const auto image = gradient(16, 8);

    Engine engine(options());
    engine.save(image, "photo");
    ASSERT_TRUE(engine.exists("photo"));

    const auto cached = engine.loadImage("photo");
    EXPECT_EQ(cached.pixels, image.pixels);

    Engine fresh(options());
    const auto decoded = fresh.loadImage("photo");
    EXPECT_EQ(decoded.width, 16);
    EXPECT_EQ(decoded.height, 8);
    EXPECT_EQ(decoded.channels, 3);
    EXPECT_TRUE(decoded.valid());
}

TEST_F(EngineTest, InvalidImageIsEncodeError) {
    media::Image broken{.width = 4, .height = 4, .channels = 3};
    broken.pixels.resize(5);

    Engine engine(options());
    expectError([&] { engine.save(broken, "bad"); }, ErrorCode::EncodeData);
    EXPECT_FALSE(engine.exists("bad"));
}

TEST_F(EngineTest, GarbageImageIsDecodeError) {
    Engine engine(options());
    writeRaw(engine.filePath("img"), "definitely not an image");
    expectError([&] { (void)engine.loadImage("img"); }, ErrorCode::DecodeData);
}

TEST_F(EngineTest, EmptyKeyIsRejected) {
    Engine engine(options());
    EXPECT_THROW(engine.save(1, ""), std::invalid_argument);
    EXPECT_THROW((void)engine.exists(""), std::invalid_argument);
}
