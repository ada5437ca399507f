#include <cstdint>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

#include <terf/build.hpp>
#include <terf/read.hpp>

#include "test_util.hpp"

using namespace terf;

namespace {

BuildResult build_into(const std::string& table, const std::string& outdir, std::size_t per_shard,
                       Compression c = Compression::None) {
    Logger log(LogLevel::Off);
    BuildOptions opts;
    opts.input = table;
    opts.outdir = outdir;
    opts.per_shard = per_shard;
    opts.threads = 2;
    opts.compression = c;
    return build_dataset(opts, log);
}

Stats summary_of(const std::string& input, std::size_t threads = 3,
                 Compression c = Compression::None) {
    Logger log(LogLevel::Off);
    ReadOptions opts;
    opts.input = input;
    opts.threads = threads;
    opts.compression = c;
    return summarize(opts, log);
}

void write_images(const std::string& path, const std::vector<Image>& images) {
    OutputFile out(path, Compression::None);
    RecordWriter writer(out);
    for (const auto& img : images)
        writer.write(img.serialize());
    writer.flush();
    out.close();
}

Image gif_image(std::int64_t id, const std::string& filename) {
    Image img;
    img.id = id;
    img.filename = filename;
    img.label_text = "Clear";
    img.set_raw(terf_test::make_gif(3, 3));
    return img;
}

Stats sample_stats(int label, const std::string& text, std::uint64_t n) {
    Stats s;
    s.total = n;
    s.label_id[label] = n;
    s.label_text[text] = n;
    s.format["JPEG"] = n;
    return s;
}

} // namespace

TEST(ReadTest, SummaryCountsEveryShard) {
    terf_test::TempDir dir("summary");
    build_into(terf_test::make_dataset(dir, 2500), dir.str("out"), 1024);

    Stats stats = summary_of(dir.str("out"));
    EXPECT_EQ(stats.total, 2500u);
    EXPECT_EQ(stats.label_text["Crystal"], 833u);
    EXPECT_EQ(stats.label_text["Clear"], 834u);
    EXPECT_EQ(stats.label_text["Precipitate"], 833u);
    EXPECT_EQ(stats.label_id[1], 834u);
    EXPECT_EQ(stats.label_raw[101], 834u);
    EXPECT_EQ(stats.source[0], 1250u);
    EXPECT_EQ(stats.source[1], 1250u);
    EXPECT_EQ(stats.format["GIF"], 2500u);
    EXPECT_EQ(stats.colorspace["Unknown"], 2500u);
}

TEST(ReadTest, SplitDoesNotChangeSummary) {
    terf_test::TempDir dir("summary_split");
    std::string table = terf_test::make_dataset(dir, 60);
    build_into(table, dir.str("many"), 7);
    build_into(table, dir.str("one"), 100);

    Stats many = summary_of(dir.str("many"), 4);
    Stats one = summary_of(dir.str("one"), 1);
    EXPECT_EQ(many, one);
    EXPECT_EQ(many.total, 60u);

    Stats by_file;
    for (const auto& path : list_inputs(dir.str("many")))
        by_file.merge(summary_of(path, 1));
    EXPECT_EQ(by_file, one);
}

TEST(ReadTest, MergeIsOrderIndependent) {
    Stats a = sample_stats(0, "Clear", 3);
    Stats b = sample_stats(1, "Crystal", 5);
    Stats c = sample_stats(0, "Clear", 2);

    EXPECT_EQ(merge(a, b), merge(b, a));
    EXPECT_EQ(merge(merge(a, b), c), merge(a, merge(b, c)));
    EXPECT_EQ(merge(a, Stats{}), a);

    Stats abc = merge(merge(a, b), c);
    EXPECT_EQ(abc.total, 10u);
    EXPECT_EQ(abc.label_text["Clear"], 5u);
    EXPECT_EQ(abc.format["JPEG"], 10u);
}

TEST(ReadTest, PrintFormat) {
    Stats s;
    s.total = 3;
    s.label_text["Clear"] = 1;
    s.label_text["Crystal"] = 2;
    s.format["PNG"] = 3;
    std::ostringstream out;
    s.print(out);
    EXPECT_EQ(out.str(), "Total: 3\n"
                         "Label: \n"
                         "    - Clear: 1\n"
                         "    - Crystal: 2\n"
                         "Format: \n"
                         "    - PNG: 3\n");
}

TEST(ReadTest, CorruptFileFailsTheJob) {
    terf_test::TempDir dir("summary_corrupt");
    build_into(terf_test::make_dataset(dir, 40), dir.str("out"), 10);
    auto files = list_inputs(dir.str("out"));
    ASSERT_EQ(files.size(), 4u);

    std::string bytes = terf_test::read_file(files[2]);
    bytes[bytes.size() / 2] = static_cast<char>(bytes[bytes.size() / 2] ^ 0x10);
    terf_test::write_file(files[2], bytes);

    EXPECT_THROW(summary_of(dir.str("out"), 2), FramingError);
    EXPECT_THROW(summary_of(files[2], 1), FramingError);
    EXPECT_EQ(summary_of(files[0], 1).total, 10u);
}

TEST(ReadTest, NonExampleRecordIsDecodeError) {
    terf_test::TempDir dir("summary_garbage");
    {
        OutputFile out(dir.str("records"), Compression::None);
        RecordWriter writer(out);
        writer.write(std::string("\xff\xff\xff\xff", 4));
        writer.flush();
        out.close();
    }
    EXPECT_THROW(summary_of(dir.str("records"), 1), RecordDecodeError);
}

TEST(ReadTest, CompressedSummary) {
    terf_test::TempDir dir("summary_zlib");
    build_into(terf_test::make_dataset(dir, 25), dir.str("out"), 10, Compression::Zlib);
    EXPECT_EQ(summary_of(dir.str("out"), 2, Compression::Zlib).total, 25u);
}

TEST(ReadTest, ListInputs) {
    terf_test::TempDir dir("list");
    terf_test::write_file(dir.str("b"), "");
    terf_test::write_file(dir.str("a"), "");
    std::filesystem::create_directories(dir.path() / "sub");
    EXPECT_EQ(list_inputs(dir.str()), (std::vector<std::string>{dir.str("a"), dir.str("b")}));
    EXPECT_EQ(list_inputs(dir.str("a")), std::vector<std::string>{dir.str("a")});
    EXPECT_THROW(list_inputs(dir.str("missing")), IoError);
}

TEST(ReadTest, ExtractWritesImagesAndTable) {
    terf_test::TempDir dir("extract");
    build_into(terf_test::make_dataset(dir, 30), dir.str("out"), 8);

    Logger log(LogLevel::Off);
    ReadOptions opts;
    opts.input = dir.str("out");
    opts.outdir = dir.str("extracted");
    opts.threads = 3;
    ExtractResult result = extract(opts, log);
    ASSERT_EQ(result.images.size(), 30u);
    EXPECT_EQ(result.info_path, (std::filesystem::absolute(dir.path() / "extracted") / "info.csv").string());

    for (int i = 1; i <= 30; ++i) {
        auto original = terf_test::read_file(dir.str("images/img" + std::to_string(i) + ".gif"));
        auto extracted = terf_test::read_file(dir.str("extracted/" + std::to_string(i) + ".gif"));
        EXPECT_EQ(extracted, original) << "image " << i;
    }

    std::ifstream info(result.info_path);
    std::string line;
    ASSERT_TRUE(std::getline(info, line));
    EXPECT_EQ(line, "image_path,image_id,label_id,label_text,label_raw,source");
    std::vector<bool> seen(31, false);
    std::size_t rows = 0;
    while (std::getline(info, line)) {
        RowDescriptor row = parse_row(line);
        ASSERT_GE(row.image_id, 1);
        ASSERT_LE(row.image_id, 30);
        EXPECT_FALSE(seen[static_cast<std::size_t>(row.image_id)]);
        seen[static_cast<std::size_t>(row.image_id)] = true;
        EXPECT_TRUE(std::filesystem::exists(row.path));
        EXPECT_EQ(row.label_id, row.image_id % 3);
        EXPECT_EQ(row.source, row.image_id % 2);
        ++rows;
    }
    EXPECT_EQ(rows, 30u);

    // The extracted table builds the same dataset again.
    build_into(result.info_path, dir.str("rebuilt"), 8);
    EXPECT_EQ(summary_of(dir.str("rebuilt")), summary_of(dir.str("out")));
}

TEST(ReadTest, ExtractRejectsEmptyAndInvalidInput) {
    terf_test::TempDir dir("extract_invalid");
    Logger log(LogLevel::Off);
    ReadOptions opts;
    opts.input = dir.str("empty");
    opts.outdir = dir.str("extracted");
    std::filesystem::create_directories(opts.input);

    EXPECT_THROW(extract(opts, log), Error);
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "extracted" / kInfoFile));

    opts.outdir.clear();
    EXPECT_THROW(extract(opts, log), UsageError);

    opts.outdir = dir.str("extracted");
    opts.input = dir.str("missing");
    EXPECT_THROW(extract(opts, log), IoError);
}

TEST(ReadTest, ExtractKeepsFilesInsideOutdir) {
    terf_test::TempDir dir("extract_escape");
    std::string victim = dir.str("outside/victim.gif");
    std::filesystem::create_directories(dir.path() / "records");
    write_images(dir.str("records/part"), {gif_image(0, victim), gif_image(0, "../up.gif")});

    Logger log(LogLevel::Off);
    ReadOptions opts;
    opts.input = dir.str("records");
    opts.outdir = dir.str("out");
    opts.threads = 2;
    ExtractResult result = extract(opts, log);

    EXPECT_FALSE(std::filesystem::exists(victim));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "up.gif"));
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "out" / "victim.gif"));
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "out" / "up.gif"));

    std::ifstream info(result.info_path);
    std::string line;
    std::getline(info, line);
    auto outdir = std::filesystem::absolute(dir.path() / "out");
    while (std::getline(info, line)) {
        auto path = std::filesystem::path(parse_row(line).path);
        EXPECT_EQ(path.parent_path(), outdir) << line;
    }
}

TEST(ReadTest, ExtractKeepsSixtyFourBitIds) {
    terf_test::TempDir dir("extract_big_id");
    Image img = gif_image(5000000000LL, "big.gif");
    img.label_id = 4294967296LL;
    write_images(dir.str("records"), {img});

    Logger log(LogLevel::Off);
    ReadOptions opts;
    opts.input = dir.str("records");
    opts.outdir = dir.str("out");
    opts.threads = 1;
    ExtractResult result = extract(opts, log);
    ASSERT_EQ(result.images.size(), 1u);
    EXPECT_EQ(result.images[0].id, 5000000000LL);
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "out" / "5000000000.gif"));

    std::ifstream info(result.info_path);
    std::string line;
    std::getline(info, line);
    ASSERT_TRUE(std::getline(info, line));
    RowDescriptor row = parse_row(line);
    EXPECT_EQ(row.image_id, 5000000000LL);
    EXPECT_EQ(row.label_id, 4294967296LL);
}

TEST(ReadTest, ExtractWarnsOnDuplicateNames) {
    terf_test::TempDir dir("extract_duplicate");
    std::filesystem::create_directories(dir.path() / "records");
    write_images(dir.str("records/a"), {gif_image(0, "same.gif")});
    write_images(dir.str("records/b"), {gif_image(0, "same.gif")});

    std::ostringstream logs;
    Logger log(LogLevel::Warn, logs);
    ReadOptions opts;
    opts.input = dir.str("records");
    opts.outdir = dir.str("out");
    opts.threads = 2;
    ExtractResult result = extract(opts, log);
    EXPECT_EQ(result.images.size(), 2u);
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "out" / "same.gif"));
    EXPECT_NE(logs.str().find("msg=\"Duplicate image name, overwriting\""), std::string::npos)
        << logs.str();
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
