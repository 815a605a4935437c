#include <gtest/gtest.h>

#include <algorithm>
#include <future>
#include <thread>
#include <vector>

#ifndef _WIN32
    #include <fcntl.h>
    #include <sys/stat.h>
    #include <unistd.h>
#endif

#include "core/transfer_engine/transfer_engine.hpp"
#include "test_helpers.hpp"

using namespace ayumi;
using ayumi::test_support::TempDir;

namespace {

constexpr std::size_t kMiB = 1024 * 1024;

class TransferEngineTest : public ::testing::Test {
protected:
    TransferEngineTest() {
        config_.chunk_size = kMiB;
    }

    auto make_source(std::string_view name, std::size_t size) -> std::filesystem::path {
        auto path = dir_ / name;
        test_support::write_file(path, test_support::make_pattern(size));
        return path;
    }

    TempDir dir_;
    infra::Config config_;
    core::TransferStatus status_;
};

} // namespace

TEST_F(TransferEngineTest, CopiesTenMebibyteImageExactly) {
    const auto source = make_source("image.iso", 10 * kMiB);
    const auto target = dir_ / "out.img";

    core::TransferEngine engine(status_, config_);
    ASSERT_TRUE(engine.start(source.string(), target.string()));
    engine.wait();

    auto snap = status_.snapshot();
    EXPECT_EQ(snap.state, core::TransferState::Completed);
    EXPECT_FALSE(snap.running);
    EXPECT_EQ(snap.progress, 1.0F);
    EXPECT_FALSE(snap.last_error.has_value());
    EXPECT_EQ(snap.bytes_written, 10 * kMiB);

    EXPECT_EQ(std::filesystem::file_size(target), 10 * kMiB);
    EXPECT_EQ(test_support::read_file(target), test_support::read_file(source));
}

TEST_F(TransferEngineTest, ProgressNeverDecreasesBetweenPolls) {
    config_.chunk_size = 64 * 1024;
    const auto source = make_source("image.iso", 4 * kMiB);

    std::vector<float> seen;
    core::TransferEngine engine(status_, config_);
    engine.set_chunk_observer([&](std::uint64_t) { seen.push_back(status_.peek().progress); });
    ASSERT_TRUE(engine.start(source.string(), (dir_ / "out.img").string()));

    std::vector<float> polled;
    while (status_.is_running()) {
        polled.push_back(status_.peek().progress);
        std::this_thread::yield();
    }
    engine.wait();
    polled.push_back(status_.peek().progress);

    ASSERT_EQ(seen.size(), 64u);
    EXPECT_TRUE(std::is_sorted(seen.begin(), seen.end()));
    EXPECT_TRUE(std::is_sorted(polled.begin(), polled.end()));
    EXPECT_EQ(polled.back(), 1.0F);
}

TEST_F(TransferEngineTest, WritesIntoMountPointUnderImageName) {
    const auto source = make_source("disk.img", 3 * kMiB + 17);
    const auto mount = dir_ / "mnt";
    std::filesystem::create_directories(mount);

    core::TransferEngine engine(status_, config_);
    ASSERT_TRUE(engine.start(source.string(), mount.string()));
    engine.wait();

    EXPECT_EQ(status_.snapshot().state, core::TransferState::Completed);
    EXPECT_EQ(test_support::read_file(mount / "disk.img"), test_support::read_file(source));
}

TEST_F(TransferEngineTest, EmptyImageCompletesWithFullProgress) {
    const auto source = make_source("empty.img", 0);
    const auto target = dir_ / "out.img";

    core::TransferEngine engine(status_, config_);
    ASSERT_TRUE(engine.start(source.string(), target.string()));
    engine.wait();

    auto snap = status_.snapshot();
    EXPECT_EQ(snap.state, core::TransferState::Completed);
    EXPECT_EQ(snap.progress, 1.0F);
    EXPECT_EQ(std::filesystem::file_size(target), 0u);
}

TEST_F(TransferEngineTest, TruncatesExistingDestinationFile) {
    const auto source = make_source("small.img", 1000);
    const auto target = dir_ / "out.img";
    test_support::write_file(target, std::vector<char>(5000, 'x'));

    core::TransferEngine engine(status_, config_);
    ASSERT_TRUE(engine.start(source.string(), target.string()));
    engine.wait();

    EXPECT_EQ(test_support::read_file(target), test_support::read_file(source));
}

TEST_F(TransferEngineTest, SequentialStartsBothComplete) {
    const auto first = make_source("first.img", 2 * kMiB);
    const auto second = make_source("second.img", 3 * kMiB + 5);

    core::TransferEngine engine(status_, config_);
    ASSERT_TRUE(engine.start(first.string(), (dir_ / "a.img").string()));
    engine.wait();
    EXPECT_EQ(status_.snapshot().state, core::TransferState::Completed);

    ASSERT_TRUE(engine.start(second.string(), (dir_ / "b.img").string()));
    engine.wait();
    auto snap = status_.snapshot();
    EXPECT_EQ(snap.state, core::TransferState::Completed);
    EXPECT_EQ(snap.progress, 1.0F);
    EXPECT_EQ(snap.bytes_written, 3 * kMiB + 5);
    EXPECT_EQ(test_support::read_file(dir_ / "b.img"), test_support::read_file(second));
}

TEST_F(TransferEngineTest, StartWhileRunningIsRejectedWithoutSideEffects) {
    const auto first = make_source("first.img", 4 * kMiB);
    const auto second = make_source("second.img", kMiB);

    std::promise<void> reached;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    bool first_chunk = true;

    core::TransferEngine engine(status_, config_);
    engine.set_chunk_observer([&](std::uint64_t) {
        if (first_chunk) {
            first_chunk = false;
            reached.set_value();
            release_future.wait();
        }
    });
    ASSERT_TRUE(engine.start(first.string(), (dir_ / "a.img").string()));
    reached.get_future().wait();

    const auto before = status_.peek();
    auto rejected = engine.start(second.string(), (dir_ / "b.img").string());
    // Без ASSERT: поток держит наблюдатель, его нужно отпустить в любом случае
    EXPECT_FALSE(rejected);
    if (!rejected) {
        EXPECT_EQ(rejected.error().code, infra::ErrorCode::Busy);
    }

    const auto after = status_.peek();
    EXPECT_TRUE(after.running);
    EXPECT_EQ(after.state, core::TransferState::Running);
    EXPECT_EQ(after.bytes_written, before.bytes_written);
    EXPECT_EQ(after.progress, before.progress);
    EXPECT_FALSE(after.last_error.has_value());
    EXPECT_FALSE(std::filesystem::exists(dir_ / "b.img"));

    release.set_value();
    engine.wait();
    EXPECT_EQ(status_.snapshot().state, core::TransferState::Completed);
    EXPECT_EQ(test_support::read_file(dir_ / "a.img"), test_support::read_file(first));
}

TEST_F(TransferEngineTest, CancelStopsAtChunkBoundary) {
    config_.chunk_size = 64 * 1024;
    const auto source = make_source("image.iso", 8 * 64 * 1024);
    const auto target = dir_ / "out.img";

    core::TransferEngine engine(status_, config_);
    engine.set_chunk_observer([&](std::uint64_t written) {
        if (written == 64 * 1024) {
            engine.cancel();
        }
    });
    ASSERT_TRUE(engine.start(source.string(), target.string()));
    engine.wait();

    auto snap = status_.snapshot();
    EXPECT_EQ(snap.state, core::TransferState::Cancelled);
    EXPECT_FALSE(snap.running);
    ASSERT_TRUE(snap.last_error.has_value());
    EXPECT_EQ(snap.last_error->code, infra::ErrorCode::Cancelled);
    EXPECT_LT(snap.progress, 1.0F);

    // На носителе ровно один целый чанк
    EXPECT_EQ(std::filesystem::file_size(target), 64u * 1024u);
}

TEST_F(TransferEngineTest, MissingDestinationDirectoryFailsWithOpenError) {
    const auto source = make_source("image.iso", kMiB);

    core::TransferEngine engine(status_, config_);
    ASSERT_TRUE(engine.start(source.string(), (dir_ / "missing" / "out.img").string()));
    engine.wait();

    auto snap = status_.snapshot();
    EXPECT_EQ(snap.state, core::TransferState::Failed);
    EXPECT_FALSE(snap.running);
    ASSERT_TRUE(snap.last_error.has_value());
    EXPECT_EQ(snap.last_error->code, infra::ErrorCode::OpenError);
    EXPECT_FALSE(snap.last_error->message.empty());
}

TEST_F(TransferEngineTest, DeviceWriteFailureIsReportedOnce) {
    if (!std::filesystem::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full is not available";
    }
    const auto source = make_source("image.iso", 2 * kMiB);

    core::TransferEngine engine(status_, config_);
    ASSERT_TRUE(engine.start(source.string(), "/dev/full"));
    engine.wait();

    auto snap = status_.snapshot();
    EXPECT_EQ(snap.state, core::TransferState::Failed);
    EXPECT_FALSE(snap.running);
    ASSERT_TRUE(snap.last_error.has_value());
    EXPECT_EQ(snap.last_error->code, infra::ErrorCode::WriteError);
    EXPECT_FALSE(snap.last_error->message.empty());

    // Ошибка забрана первым снимком
    EXPECT_FALSE(status_.snapshot().last_error.has_value());
}

TEST_F(TransferEngineTest, EngineIsReusableAfterFailure) {
    const auto source = make_source("image.iso", kMiB);

    core::TransferEngine engine(status_, config_);
    ASSERT_TRUE(engine.start(source.string(), (dir_ / "missing" / "out.img").string()));
    engine.wait();
    ASSERT_EQ(status_.peek().state, core::TransferState::Failed);

    ASSERT_TRUE(engine.start(source.string(), (dir_ / "out.img").string()));
    engine.wait();
    auto snap = status_.snapshot();
    EXPECT_EQ(snap.state, core::TransferState::Completed);
    EXPECT_FALSE(snap.last_error.has_value());
}

TEST_F(TransferEngineTest, ValidationErrorsDoNotTouchStatus) {
    core::TransferEngine engine(status_, config_);

    auto empty_source = engine.start("", (dir_ / "out.img").string());
    ASSERT_FALSE(empty_source);
    EXPECT_EQ(empty_source.error().code, infra::ErrorCode::EmptySource);

    auto missing = engine.start((dir_ / "nope.iso").string(), (dir_ / "out.img").string());
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, infra::ErrorCode::SourceUnreadable);

    auto snap = status_.snapshot();
    EXPECT_EQ(snap.state, core::TransferState::Idle);
    EXPECT_FALSE(snap.running);
    EXPECT_FALSE(snap.last_error.has_value());
    engine.wait(); // нечего ждать
}

TEST_F(TransferEngineTest, CancelAfterLastChunkStillCompletes) {
    config_.chunk_size = 64 * 1024;
    const auto source = make_source("image.iso", 4 * 64 * 1024);
    const auto target = dir_ / "out.img";

    core::TransferEngine engine(status_, config_);
    engine.set_chunk_observer([&](std::uint64_t written) {
        if (written == 4 * 64 * 1024) {
            engine.cancel();
        }
    });
    ASSERT_TRUE(engine.start(source.string(), target.string()));
    engine.wait();

    auto snap = status_.snapshot();
    EXPECT_EQ(snap.state, core::TransferState::Completed);
    EXPECT_EQ(snap.progress, 1.0F);
    EXPECT_FALSE(snap.last_error.has_value());
    EXPECT_EQ(test_support::read_file(target), test_support::read_file(source));
}

TEST_F(TransferEngineTest, ImageInsideTargetDirectoryIsRejected) {
    const auto mount = dir_ / "mnt";
    const auto image = mount / "image.iso";
    test_support::write_file(image, test_support::make_pattern(kMiB));

    core::TransferEngine engine(status_, config_);
    auto res = engine.start(image.string(), mount.string());
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, infra::ErrorCode::TargetIsSource);

    auto same_path = engine.start(image.string(), image.string());
    ASSERT_FALSE(same_path);
    EXPECT_EQ(same_path.error().code, infra::ErrorCode::TargetIsSource);

    engine.wait();
    EXPECT_EQ(status_.snapshot().state, core::TransferState::Idle);
    EXPECT_EQ(std::filesystem::file_size(image), kMiB);
}

TEST_F(TransferEngineTest, TargetTurnedIntoImageAfterValidationFails) {
    const auto images = dir_ / "images";
    const auto image = images / "image.iso";
    test_support::write_file(image, test_support::make_pattern(kMiB));
    const auto mount = dir_ / "mnt";
    std::filesystem::create_directories(mount);

    auto request = core::validate(image.string(), core::device_from_identifier(mount.string()));
    ASSERT_TRUE(request);

    // Теперь mnt/image.iso и есть исходный образ
    std::filesystem::remove(mount);
    std::error_code ec;
    std::filesystem::create_directory_symlink(images, mount, ec);
    if (ec) {
        GTEST_SKIP() << "symlinks are not available: " << ec.message();
    }

    core::TransferEngine engine(status_, config_);
    ASSERT_TRUE(engine.start(std::move(*request)));
    engine.wait();

    auto snap = status_.snapshot();
    EXPECT_EQ(snap.state, core::TransferState::Failed);
    ASSERT_TRUE(snap.last_error.has_value());
    EXPECT_EQ(snap.last_error->code, infra::ErrorCode::OpenError);
    EXPECT_EQ(test_support::read_file(image), test_support::make_pattern(kMiB));
}

#ifndef _WIN32

TEST_F(TransferEngineTest, ReadFailureIsReported) {
    const auto source = make_source("image.iso", kMiB);
    auto request = core::validate(source.string(), core::device_from_identifier((dir_ / "out.img").string()));
    ASSERT_TRUE(request);

    // Каталог открывается на чтение, но read() на нём даёт EISDIR
    std::filesystem::remove(source);
    std::filesystem::create_directory(source);

    core::TransferEngine engine(status_, config_);
    ASSERT_TRUE(engine.start(std::move(*request)));
    engine.wait();

    auto snap = status_.snapshot();
    EXPECT_EQ(snap.state, core::TransferState::Failed);
    EXPECT_FALSE(snap.running);
    ASSERT_TRUE(snap.last_error.has_value());
    EXPECT_EQ(snap.last_error->code, infra::ErrorCode::ReadError);
    EXPECT_FALSE(snap.last_error->message.empty());
}

TEST_F(TransferEngineTest, SourceOfUnknownSizeIsIndeterminate) {
    const auto fifo = dir_ / "stream.img";
    ASSERT_EQ(::mkfifo(fifo.c_str(), 0600), 0);

    // O_RDWR не блокируется и держит пишущий конец, пока тест его не закроет
    const int feed = ::open(fifo.c_str(), O_RDWR);
    ASSERT_GE(feed, 0);
    const auto data = test_support::make_pattern(4096);
    ASSERT_EQ(::write(feed, data.data(), data.size()), static_cast<ssize_t>(data.size()));

    auto request = core::validate(fifo.string(), core::device_from_identifier((dir_ / "out.img").string()));
    ASSERT_TRUE(request);
    EXPECT_FALSE(request->source_size().has_value());

    std::promise<void> first_chunk;
    bool indeterminate = false;
    bool seen = false;
    core::TransferEngine engine(status_, config_);
    engine.set_chunk_observer([&](std::uint64_t) {
        if (!seen) {
            seen = true;
            indeterminate = status_.peek().indeterminate;
            first_chunk.set_value();
        }
    });
    ASSERT_TRUE(engine.start(std::move(*request)));

    first_chunk.get_future().wait();
    ::close(feed); // конец данных
    engine.wait();

    EXPECT_TRUE(indeterminate);
    auto snap = status_.snapshot();
    EXPECT_EQ(snap.state, core::TransferState::Completed);
    EXPECT_EQ(snap.progress, 1.0F);
    EXPECT_FALSE(snap.indeterminate);
    EXPECT_FALSE(snap.total_bytes.has_value());
    EXPECT_EQ(test_support::read_file(dir_ / "out.img"), data);
}

#endif
