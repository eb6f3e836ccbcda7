#include <gtest/gtest.h>

#include <algorithm>
#include <numeric>

#include "core/errors.hpp"
#include "session/session_manager.hpp"
#include "session/upload_store.hpp"
#include "test_support.hpp"

using namespace fchat;
using namespace fchat::session;

namespace {

std::vector<std::vector<uint8_t>> split(const std::vector<uint8_t>& bytes, std::size_t parts)
{
    std::vector<std::vector<uint8_t>> out(parts);
    const std::size_t step = (bytes.size() + parts - 1) / parts;
    for (std::size_t i = 0; i < parts; ++i) {
        const std::size_t b = std::min(bytes.size(), i * step);
        const std::size_t e = std::min(bytes.size(), b + step);
        out[i].assign(bytes.begin() + static_cast<std::ptrdiff_t>(b),
                      bytes.begin() + static_cast<std::ptrdiff_t>(e));
    }
    return out;
}

class SessionManagerTest : public ::testing::Test
{
protected:
    explicit SessionManagerTest(util::HistoryPolicy policy = util::HistoryPolicy::Skip)
        : catalog_({test::gps_schema(), test::att_schema()}),
          mgr_(catalog_, retrieval_, completion_, recorder_,
               {dir_.path() / "uploads", dir_.path() / "processed"}, {}, policy)
    {
        retrieval_.matches = {test::match_for(test::gps_schema(), 0.1)};
    }

    void upload(const std::string& id, const std::vector<uint8_t>& bytes, std::size_t parts,
                const std::string& name = "flight.bin")
    {
        auto chunks = split(bytes, parts);
        for (std::size_t i = 0; i < parts; ++i)
            mgr_.receive_chunk(id, i, chunks[i], name, parts);
    }

    test::TempDir            dir_;
    core::SchemaCatalog      catalog_;
    test::FakeRetrieval      retrieval_;
    test::ScriptedCompletion completion_;
    test::RecordingDecoder   recorder_;
    SessionManager           mgr_;
};

class RecordPolicyTest : public SessionManagerTest
{
protected:
    RecordPolicyTest() : SessionManagerTest(util::HistoryPolicy::Record) {}
};

} // namespace

TEST_F(SessionManagerTest, OpenSeedsGreeting)
{
    mgr_.open("c1");
    EXPECT_TRUE(mgr_.contains("c1"));
    EXPECT_FALSE(mgr_.has_pipeline("c1"));
    EXPECT_EQ(mgr_.history("c1"), (core::History{{"assistant", core::kGreeting}}));
    EXPECT_EQ(mgr_.size(), 1u);
}

TEST_F(SessionManagerTest, ChunkAckEchoesIndexAndTotal)
{
    mgr_.open("c1");
    const auto ack = mgr_.receive_chunk("c1", 1, test::bytes_of("B"), "f.bin", 3);
    EXPECT_EQ(ack.index, 1u);
    EXPECT_EQ(ack.total, 3u);
}

TEST_F(SessionManagerTest, AnyArrivalOrderReconstructsTheSameBytes)
{
    const std::vector<uint8_t> bytes = test::bytes_of("0123456789abcdefghijklmnopqrstuvwxyz");
    const auto chunks = split(bytes, 4);

    std::vector<std::size_t> order(4);
    std::iota(order.begin(), order.end(), 0);

    mgr_.open("c1");
    std::size_t runs = 0;
    do {
        for (auto i : order)
            mgr_.receive_chunk("c1", i, chunks[i], "seq.bin", 4);
        const auto res = mgr_.complete_transfer("c1", "seq.bin", 4);
        EXPECT_EQ(test::read_file(res.saved), bytes);
        ++runs;
    } while (std::next_permutation(order.begin(), order.end()));

    EXPECT_EQ(runs, 24u);
    ASSERT_EQ(recorder_.seen.size(), 24u);
    for (const auto& seen : recorder_.seen)
        EXPECT_EQ(seen, bytes);
}

TEST_F(SessionManagerTest, CountMismatchIsIncompleteTransferAndKeepsBuffer)
{
    mgr_.open("c1");
    mgr_.receive_chunk("c1", 0, test::bytes_of("AA"), "f.bin", 3);
    mgr_.receive_chunk("c1", 1, test::bytes_of("BB"), "f.bin", 3);

    try {
        mgr_.complete_transfer("c1", "f.bin", 3);
        FAIL() << "expected IncompleteTransfer";
    } catch (const IncompleteTransfer& e) {
        EXPECT_EQ(e.received(), 2u);
        EXPECT_EQ(e.expected(), 3u);
        EXPECT_STREQ(e.what(), "Missing chunks: expected 3, got 2");
    }

    // the late chunk still completes the same transfer
    mgr_.receive_chunk("c1", 2, test::bytes_of("CC"), "f.bin", 3);
    const auto res = mgr_.complete_transfer("c1", "f.bin", 3);
    EXPECT_EQ(test::read_file(res.saved), test::bytes_of("AABBCC"));
}

TEST_F(SessionManagerTest, GapInIndicesIsMissingChunk)
{
    mgr_.open("c1");
    for (std::size_t i : {0u, 2u, 5u})
        mgr_.receive_chunk("c1", i, test::bytes_of("x"), "f.bin", 3);

    try {
        mgr_.complete_transfer("c1", "f.bin", 3);
        FAIL() << "expected MissingChunk";
    } catch (const MissingChunk& e) {
        EXPECT_EQ(e.index(), 1u);
    }
    EXPECT_TRUE(recorder_.seen.empty());
}

TEST_F(SessionManagerTest, DuplicateIndexOverwrites)
{
    mgr_.open("c1");
    mgr_.receive_chunk("c1", 0, test::bytes_of("old"), "f.bin", 2);
    mgr_.receive_chunk("c1", 1, test::bytes_of("-tail"), "f.bin", 2);
    mgr_.receive_chunk("c1", 0, test::bytes_of("new"), "f.bin", 2);

    const auto res = mgr_.complete_transfer("c1", "f.bin", 2);
    EXPECT_EQ(test::read_file(res.saved), test::bytes_of("new-tail"));
}

TEST_F(SessionManagerTest, NewFileNameStartsANewTransfer)
{
    mgr_.open("c1");
    mgr_.receive_chunk("c1", 0, test::bytes_of("stale"), "a.bin", 2);
    mgr_.receive_chunk("c1", 0, test::bytes_of("fresh"), "b.bin", 1);

    const auto res = mgr_.complete_transfer("c1", "b.bin", 1);
    EXPECT_EQ(test::read_file(res.saved), test::bytes_of("fresh"));
}

TEST_F(SessionManagerTest, CompletionForAnotherFileKeepsTheBufferedTransfer)
{
    mgr_.open("c1");
    mgr_.receive_chunk("c1", 0, test::bytes_of("a-bytes"), "a.bin", 1);

    EXPECT_THROW(mgr_.complete_transfer("c1", "b.bin", 1), IncompleteTransfer);
    EXPECT_TRUE(recorder_.seen.empty());

    const auto res = mgr_.complete_transfer("c1", "a.bin", 1);
    EXPECT_EQ(res.saved.extension(), ".bin");
    EXPECT_EQ(test::read_file(res.saved), test::bytes_of("a-bytes"));
}

TEST_F(SessionManagerTest, CompletedTransferBindsPipelineAndWritesArtifacts)
{
    mgr_.open("c1");
    upload("c1", test::bytes_of("payload"), 2, "My Flight.BIN");

    const auto res = mgr_.complete_transfer("c1", "My Flight.BIN", 2);
    EXPECT_EQ(res.saved.parent_path(), dir_.path() / "uploads");
    EXPECT_EQ(res.saved.extension(), ".BIN");
    ASSERT_TRUE(res.processed);
    EXPECT_EQ(res.processed->filename().string(),
              res.saved.stem().string() + "_processed.json");
    EXPECT_TRUE(std::filesystem::exists(*res.processed));
    EXPECT_TRUE(res.decode_error.empty());

    EXPECT_TRUE(mgr_.has_pipeline("c1"));
    EXPECT_EQ(mgr_.file_path("c1"), res.saved);
}

TEST_F(SessionManagerTest, DecodeFailureKeepsFileButDropsPipeline)
{
    mgr_.open("c1");
    upload("c1", test::bytes_of("good"), 1);
    mgr_.complete_transfer("c1", "flight.bin", 1);
    ASSERT_TRUE(mgr_.has_pipeline("c1"));

    recorder_.fail = true;
    upload("c1", test::bytes_of("junk"), 1);
    const auto res = mgr_.complete_transfer("c1", "flight.bin", 1);

    EXPECT_TRUE(std::filesystem::exists(res.saved));
    EXPECT_FALSE(res.processed);
    EXPECT_NE(res.decode_error.find("no DataFlash messages"), std::string::npos);
    EXPECT_FALSE(mgr_.has_pipeline("c1"));
}

TEST_F(SessionManagerTest, ChatBeforeUploadNeedsAPipeline)
{
    mgr_.open("c1");
    try {
        mgr_.run_turn("c1", "what was the max altitude");
        FAIL() << "expected NoPipelineBound";
    } catch (const NoPipelineBound& e) {
        EXPECT_STREQ(e.what(), "Please upload a log file first before asking questions.");
    }
    EXPECT_FALSE(mgr_.has_pipeline("c1"));
    EXPECT_EQ(mgr_.history("c1").size(), 1u);
    EXPECT_EQ(completion_.calls.size(), 0u);
    EXPECT_TRUE(retrieval_.queries.empty());
}

TEST_F(SessionManagerTest, TurnAppendsQueryAndAnswer)
{
    mgr_.open("c1");
    upload("c1", test::bytes_of("log"), 1);
    mgr_.complete_transfer("c1", "flight.bin", 1);

    completion_.replies = {R"([{"message_type":"RAW","required_fields":[]}])", "It is 3 bytes."};
    bool started = false;
    const auto answer = mgr_.run_turn(mgr_.acquire("c1"), "how big is it", [&] { started = true; });

    EXPECT_TRUE(started);
    EXPECT_EQ(answer, "It is 3 bytes.");
    const auto h = mgr_.history("c1");
    ASSERT_EQ(h.size(), 3u);
    EXPECT_EQ(h[1], (core::Message{"user", "how big is it"}));
    EXPECT_EQ(h[2], (core::Message{"assistant", "It is 3 bytes."}));
}

TEST_F(SessionManagerTest, FailedTurnLeavesHistoryUntouchedByDefault)
{
    mgr_.open("c1");
    upload("c1", test::bytes_of("log"), 1);
    mgr_.complete_transfer("c1", "flight.bin", 1);

    retrieval_.fail = true;
    EXPECT_THROW(mgr_.run_turn("c1", "altitude?"), CollaboratorFailure);
    EXPECT_EQ(mgr_.history("c1").size(), 1u);
}

TEST_F(RecordPolicyTest, FailedTurnIsRecordedWithTheError)
{
    mgr_.open("c1");
    upload("c1", test::bytes_of("log"), 1);
    mgr_.complete_transfer("c1", "flight.bin", 1);

    retrieval_.fail = true;
    EXPECT_THROW(mgr_.run_turn("c1", "altitude?"), CollaboratorFailure);

    const auto h = mgr_.history("c1");
    ASSERT_EQ(h.size(), 3u);
    EXPECT_EQ(h[1], (core::Message{"user", "altitude?"}));
    EXPECT_EQ(h[2].role, "assistant");
    EXPECT_NE(h[2].content.find("vector index unavailable"), std::string::npos);
}

TEST_F(SessionManagerTest, CloseReleasesStateAndIsIdempotent)
{
    mgr_.open("c1");
    mgr_.receive_chunk("c1", 0, test::bytes_of("x"), "f.bin", 2);
    auto s = mgr_.acquire("c1");

    mgr_.close("c1");
    EXPECT_FALSE(mgr_.contains("c1"));
    EXPECT_TRUE(s->closed);
    EXPECT_TRUE(s->transfer.chunks.empty());
    EXPECT_TRUE(s->history.empty());

    EXPECT_NO_THROW(mgr_.close("c1"));
    EXPECT_NO_THROW(mgr_.close("never-seen"));
    EXPECT_THROW(mgr_.receive_chunk("c1", 0, {}, "f.bin", 1), UnknownSession);
    EXPECT_THROW(mgr_.run_turn("c1", "hi"), UnknownSession);
}

TEST_F(SessionManagerTest, ResultOfAClosedSessionNeverReachesItsSuccessor)
{
    mgr_.open("c1");
    upload("c1", test::bytes_of("log"), 1);
    auto pending = mgr_.take_upload(mgr_.acquire("c1"), "flight.bin", 1);

    mgr_.close("c1");
    mgr_.open("c1");

    const auto res = mgr_.bind_upload(std::move(pending));
    EXPECT_TRUE(res.processed);
    EXPECT_FALSE(mgr_.has_pipeline("c1"));
    EXPECT_FALSE(mgr_.file_path("c1"));
}

TEST_F(SessionManagerTest, SessionsAreIsolated)
{
    mgr_.open("a");
    mgr_.open("b");
    upload("a", test::bytes_of("log"), 1);
    mgr_.complete_transfer("a", "flight.bin", 1);

    EXPECT_TRUE(mgr_.has_pipeline("a"));
    EXPECT_FALSE(mgr_.has_pipeline("b"));
    EXPECT_THROW(mgr_.complete_transfer("b", "flight.bin", 1), IncompleteTransfer);
}

TEST(UploadStore, UniqueNamesAndSanitizedExtension)
{
    test::TempDir dir;
    const auto a = save_upload(dir.path(), "x.bin", test::bytes_of("1"));
    const auto b = save_upload(dir.path(), "x.bin", test::bytes_of("2"));
    EXPECT_NE(a, b);
    EXPECT_EQ(test::read_file(a), test::bytes_of("1"));
    EXPECT_EQ(test::read_file(b), test::bytes_of("2"));

    EXPECT_EQ(safe_extension("../../etc/passwd"), "");
    EXPECT_EQ(safe_extension("log.t$x"), ".tx");
    EXPECT_EQ(safe_extension("flight.BIN"), ".BIN");
}
