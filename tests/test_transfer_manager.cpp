#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "transfer_manager.h"
#include "checksum.h"
#include "fs.h"
#include "logger.h"
#include "test_support.h"
#include <cctype>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace whisp;
using namespace whisp::testing_support;
using ::testing::_;
using ::testing::DoAll;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgReferee;

class TransferManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        remove_tree(kScratch);
        create_directories(kScratch);
        write_file(kHelloPath, "Hello, World!");

        transport_ = std::make_shared<NiceMock<MockTransport>>();

        TransferConfig config;
        config.event_workers = 0;
        config.download_directory = kScratch + "/downloads";
        manager_ = std::make_unique<TransferManager>(transport_, config);
    }

    void TearDown() override {
        manager_.reset();
        transport_.reset();
        remove_tree(kScratch);
    }

    std::shared_ptr<Transfer> started_transfer(FileHandle handle = 1) {
        EXPECT_CALL(*transport_, initiate(_, _, _, _, _, _))
            .WillOnce(DoAll(SetArgReferee<5>(handle), Return(TransferResult::Success())));
        auto transfer = manager_->send_file(5, kHelloPath);
        EXPECT_NE(transfer, nullptr);
        EXPECT_TRUE(manager_->start_send(transfer).success);
        return transfer;
    }

    const std::string kScratch = "whisp_test_manager";
    const std::string kHelloPath = "whisp_test_manager/hello.txt";

    std::shared_ptr<NiceMock<MockTransport>> transport_;
    std::unique_ptr<TransferManager> manager_;
};

TEST_F(TransferManagerTest, RegistersTransportCallbacks) {
    EXPECT_TRUE(transport_->has_callbacks());
    EXPECT_EQ(manager_->get_transport(), transport_);
}

TEST_F(TransferManagerTest, SendFileCreatesPendingTransfer) {
    EXPECT_CALL(*transport_, initiate(_, _, _, _, _, _)).Times(0);

    TransferResult result;
    auto transfer = manager_->send_file(5, kHelloPath, &result);
    ASSERT_NE(transfer, nullptr);
    EXPECT_TRUE(result.success);

    EXPECT_EQ(transfer->direction(), TransferDirection::OUTGOING);
    EXPECT_EQ(transfer->state(), TransferState::PENDING);
    EXPECT_EQ(transfer->peer_id(), 5u);
    EXPECT_EQ(transfer->file_name(), "hello.txt");
    EXPECT_EQ(transfer->file_path(), kHelloPath);
    EXPECT_EQ(transfer->file_size(), 13u);
    EXPECT_EQ(transfer->file_checksum(), Sha256::hash("Hello, World!"));
    EXPECT_FALSE(transfer->has_file_handle());
    EXPECT_EQ(transfer->id().size(), 32u);

    EXPECT_EQ(manager_->get_transfer(transfer->id()), transfer);
}

TEST_F(TransferManagerTest, SendFileRejectsMissingFile) {
    TransferResult result;
    EXPECT_EQ(manager_->send_file(5, kScratch + "/nope.txt", &result), nullptr);
    EXPECT_EQ(result.error, TransferErrorCode::FILE_NOT_FOUND);
    EXPECT_TRUE(manager_->get_transfers_by_peer(5).empty());
}

TEST_F(TransferManagerTest, SendFileRejectsDirectory) {
    TransferResult result;
    EXPECT_EQ(manager_->send_file(5, kScratch, &result), nullptr);
    EXPECT_EQ(result.error, TransferErrorCode::IS_DIRECTORY);
}

TEST_F(TransferManagerTest, SendFileRejectsOversizeFile) {
    manager_->set_max_file_size(12);
    EXPECT_EQ(manager_->get_max_file_size(), 12u);

    TransferResult result;
    EXPECT_EQ(manager_->send_file(5, kHelloPath, &result), nullptr);
    EXPECT_EQ(result.error, TransferErrorCode::FILE_TOO_LARGE);

    manager_->set_max_file_size(13);
    EXPECT_NE(manager_->send_file(5, kHelloPath), nullptr);
}

TEST_F(TransferManagerTest, StartSendAnnouncesAndActivates) {
    auto transfer = manager_->send_file(5, kHelloPath);
    ASSERT_NE(transfer, nullptr);

    EXPECT_CALL(*transport_, initiate(5u, FileKind::DATA, 13u, TransferManager::make_file_id(transfer->id()),
                                      "hello.txt", _))
        .WillOnce(DoAll(SetArgReferee<5>(FileHandle(1)), Return(TransferResult::Success())));

    TransferResult result = manager_->start_send(transfer);
    ASSERT_TRUE(result.success) << result.error_message;

    EXPECT_EQ(transfer->state(), TransferState::ACTIVE);
    EXPECT_TRUE(transfer->has_file_handle());
    EXPECT_EQ(transfer->file_handle(), 1u);
    EXPECT_EQ(transfer->file_size(), 13u);
    EXPECT_EQ(transfer->file_checksum(), Sha256::hash("Hello, World!"));
}

TEST_F(TransferManagerTest, StartSendRequiresPendingState) {
    auto transfer = started_transfer();

    EXPECT_CALL(*transport_, initiate(_, _, _, _, _, _)).Times(0);
    TransferResult result = manager_->start_send(transfer);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, TransferErrorCode::INVALID_STATE);
    EXPECT_EQ(transfer->state(), TransferState::ACTIVE);
}

TEST_F(TransferManagerTest, StartSendTransportFailureFailsTransfer) {
    auto transfer = manager_->send_file(5, kHelloPath);
    ASSERT_NE(transfer, nullptr);

    EXPECT_CALL(*transport_, initiate(_, _, _, _, _, _))
        .WillOnce(Return(TransferResult::Error(TransferErrorCode::TRANSPORT_ERROR, "friend offline")));

    TransferResult result = manager_->start_send(transfer);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, TransferErrorCode::TRANSPORT_ERROR);
    EXPECT_NE(result.error_message.find("friend offline"), std::string::npos);

    EXPECT_EQ(transfer->state(), TransferState::FAILED);
    EXPECT_TRUE(transfer->end_time().has_value());
    EXPECT_FALSE(transfer->has_file_handle());
    EXPECT_EQ(transfer->last_error().error, TransferErrorCode::TRANSPORT_ERROR);

    // Nothing was bound, so a pull request for the default handle is not serviced
    EXPECT_CALL(*transport_, push_chunk(_, _, _, _)).Times(0);
    transport_->pull(5, 0, 0, 5);
    transport_->pull(5, 1, 0, 5);
}

TEST_F(TransferManagerTest, StartSendWithoutTransport) {
    TransferConfig config;
    config.event_workers = 0;
    TransferManager manager(config);

    auto transfer = manager.send_file(5, kHelloPath);
    ASSERT_NE(transfer, nullptr);
    TransferResult result = manager.start_send(transfer);
    EXPECT_EQ(result.error, TransferErrorCode::NO_TRANSPORT);
    EXPECT_EQ(transfer->state(), TransferState::PENDING);
}

TEST_F(TransferManagerTest, StartSendRejectsForeignAndIncomingTransfers) {
    auto foreign = std::make_shared<Transfer>("foreign", 5, TransferDirection::OUTGOING, "x", 1);
    EXPECT_EQ(manager_->start_send(foreign).error, TransferErrorCode::NOT_FOUND);
    EXPECT_EQ(manager_->start_send(nullptr).error, TransferErrorCode::INVALID_ARGUMENT);

    transport_->announce(9, 3, 10, "incoming.bin");
    auto incoming = manager_->get_transfers_by_peer(9);
    ASSERT_EQ(incoming.size(), 1u);
    EXPECT_EQ(manager_->start_send(incoming[0]).error, TransferErrorCode::WRONG_DIRECTION);
}

TEST_F(TransferManagerTest, PauseAndResume) {
    auto transfer = started_transfer(4);

    EXPECT_CALL(*transport_, control(5u, 4u, FileControl::PAUSE)).Times(1);
    EXPECT_TRUE(manager_->pause_transfer(transfer->id()).success);
    EXPECT_EQ(transfer->state(), TransferState::PAUSED);
    EXPECT_EQ(manager_->get_active_transfers().size(), 1u);

    // Pausing a paused transfer errors and leaves the state alone
    TransferResult again = manager_->pause_transfer(transfer->id());
    EXPECT_EQ(again.error, TransferErrorCode::INVALID_STATE);
    EXPECT_EQ(transfer->state(), TransferState::PAUSED);

    EXPECT_CALL(*transport_, control(5u, 4u, FileControl::RESUME)).Times(1);
    EXPECT_TRUE(manager_->resume_transfer(transfer->id()).success);
    EXPECT_EQ(transfer->state(), TransferState::ACTIVE);

    TransferResult resume_active = manager_->resume_transfer(transfer->id());
    EXPECT_EQ(resume_active.error, TransferErrorCode::INVALID_STATE);
    EXPECT_EQ(transfer->state(), TransferState::ACTIVE);
}

TEST_F(TransferManagerTest, PauseSurfacesTransportError) {
    auto transfer = started_transfer();

    EXPECT_CALL(*transport_, control(_, _, FileControl::PAUSE))
        .WillOnce(Return(TransferResult::Error(TransferErrorCode::TRANSPORT_ERROR, "queue full")));
    TransferResult result = manager_->pause_transfer(transfer->id());
    EXPECT_EQ(result.error, TransferErrorCode::TRANSPORT_ERROR);
    EXPECT_EQ(transfer->state(), TransferState::ACTIVE);
}

TEST_F(TransferManagerTest, PauseRequiresActive) {
    auto transfer = manager_->send_file(5, kHelloPath);
    ASSERT_NE(transfer, nullptr);
    EXPECT_CALL(*transport_, control(_, _, _)).Times(0);
    EXPECT_EQ(manager_->pause_transfer(transfer->id()).error, TransferErrorCode::INVALID_STATE);
    EXPECT_EQ(manager_->resume_transfer(transfer->id()).error, TransferErrorCode::INVALID_STATE);
}

TEST_F(TransferManagerTest, CancelActiveOutgoing) {
    auto transfer = started_transfer(2);

    EXPECT_CALL(*transport_, control(5u, 2u, FileControl::CANCEL)).Times(1);
    EXPECT_TRUE(manager_->cancel_transfer(transfer->id()).success);
    EXPECT_EQ(transfer->state(), TransferState::CANCELLED);
    EXPECT_TRUE(transfer->end_time().has_value());
    EXPECT_TRUE(transfer->is_complete());
    EXPECT_TRUE(manager_->get_active_transfers().empty());

    // The source file is never touched
    EXPECT_TRUE(file_exists(kHelloPath));

    auto end_time = transfer->end_time();
    TransferResult again = manager_->cancel_transfer(transfer->id());
    EXPECT_EQ(again.error, TransferErrorCode::INVALID_STATE);
    EXPECT_EQ(transfer->state(), TransferState::CANCELLED);
    EXPECT_TRUE(transfer->end_time() == end_time);
}

TEST_F(TransferManagerTest, CancelUnannouncedSkipsRemoteSignal) {
    auto transfer = manager_->send_file(5, kHelloPath);
    ASSERT_NE(transfer, nullptr);

    EXPECT_CALL(*transport_, control(_, _, _)).Times(0);
    EXPECT_TRUE(manager_->cancel_transfer(transfer->id()).success);
    EXPECT_EQ(transfer->state(), TransferState::CANCELLED);
}

TEST_F(TransferManagerTest, CancelProceedsWhenRemoteSignalFails) {
    auto transfer = started_transfer();

    EXPECT_CALL(*transport_, control(_, _, FileControl::CANCEL))
        .WillOnce(Return(TransferResult::Error(TransferErrorCode::TRANSPORT_ERROR, "friend offline")));
    EXPECT_TRUE(manager_->cancel_transfer(transfer->id()).success);
    EXPECT_EQ(transfer->state(), TransferState::CANCELLED);
}

TEST_F(TransferManagerTest, CancelDoesNotFireCompletion) {
    auto transfer = started_transfer();
    int completions = 0;
    manager_->set_completion_callback(transfer->id(), [&](const Transfer&, const TransferResult&) {
        ++completions;
    });

    ASSERT_TRUE(manager_->cancel_transfer(transfer->id()).success);
    EXPECT_EQ(completions, 0);
}

TEST_F(TransferManagerTest, UnknownTransferIds) {
    EXPECT_EQ(manager_->get_transfer("missing"), nullptr);
    EXPECT_EQ(manager_->accept_incoming("missing").error, TransferErrorCode::NOT_FOUND);
    EXPECT_EQ(manager_->pause_transfer("missing").error, TransferErrorCode::NOT_FOUND);
    EXPECT_EQ(manager_->resume_transfer("missing").error, TransferErrorCode::NOT_FOUND);
    EXPECT_EQ(manager_->cancel_transfer("missing").error, TransferErrorCode::NOT_FOUND);
    EXPECT_EQ(manager_->set_progress_callback("missing", nullptr).error, TransferErrorCode::NOT_FOUND);
    EXPECT_EQ(manager_->set_completion_callback("missing", nullptr).error, TransferErrorCode::NOT_FOUND);
}

TEST_F(TransferManagerTest, AcceptRejectsOutgoing) {
    auto transfer = manager_->send_file(5, kHelloPath);
    ASSERT_NE(transfer, nullptr);
    EXPECT_EQ(manager_->accept_incoming(transfer->id(), kScratch).error, TransferErrorCode::WRONG_DIRECTION);
}

TEST_F(TransferManagerTest, QueriesByPeerAndActivity) {
    auto first = started_transfer(1);
    auto second = manager_->send_file(5, kHelloPath);
    auto third = manager_->send_file(6, kHelloPath);
    ASSERT_NE(second, nullptr);
    ASSERT_NE(third, nullptr);

    EXPECT_EQ(manager_->get_transfers_by_peer(5).size(), 2u);
    EXPECT_EQ(manager_->get_transfers_by_peer(6).size(), 1u);
    EXPECT_TRUE(manager_->get_transfers_by_peer(7).empty());

    auto active = manager_->get_active_transfers();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0], first);
}

TEST_F(TransferManagerTest, Statistics) {
    auto active = started_transfer(1);
    auto pending = manager_->send_file(6, kHelloPath);
    ASSERT_NE(pending, nullptr);
    transport_->announce(9, 7, 100, "incoming.bin");

    transport_->pull(5, 1, 0, 5);

    nlohmann::json stats = manager_->get_statistics();
    EXPECT_EQ(stats["total_transfers"], 3);
    EXPECT_EQ(stats["outgoing_transfers"], 2);
    EXPECT_EQ(stats["incoming_transfers"], 1);
    EXPECT_EQ(stats["states"]["pending"], 2);
    EXPECT_EQ(stats["states"]["active"], 1);
    EXPECT_EQ(stats["states"]["completed"], 0);
    EXPECT_EQ(stats["total_bytes_sent"], 5);
    EXPECT_EQ(stats["total_bytes_received"], 0);
}

TEST_F(TransferManagerTest, ValidateIncomingFilename) {
    EXPECT_TRUE(TransferManager::validate_incoming_filename("report.pdf").success);
    EXPECT_TRUE(TransferManager::validate_incoming_filename(".hidden").success);
    EXPECT_TRUE(TransferManager::validate_incoming_filename("name with spaces.txt").success);

    const std::string unsafe[] = {
        "", ".", "..", "../../etc/passwd", "dir/file.txt", "dir\\file.txt", "/etc/passwd",
        "a<b", "a>b", "a:b", "a\"b", "a|b", "a?b", "a*b", std::string("a\0b", 3)
    };
    for (const auto& name : unsafe) {
        TransferResult result = TransferManager::validate_incoming_filename(name);
        EXPECT_FALSE(result.success) << "accepted: " << name;
        EXPECT_EQ(result.error, TransferErrorCode::UNSAFE_FILENAME);
    }
}

TEST_F(TransferManagerTest, GeneratedIdsAreHexAndUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        std::string id = TransferManager::generate_transfer_id();
        ASSERT_EQ(id.size(), 32u);
        EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 1000u);
}

TEST_F(TransferManagerTest, FileIdCarriesTransferIdBytes) {
    const std::string id = "0123456789abcdef0123456789abcdef";
    FileId file_id = TransferManager::make_file_id(id);
    EXPECT_EQ(std::string(file_id.begin(), file_id.end()), id);

    FileId short_id = TransferManager::make_file_id("abc");
    EXPECT_EQ(short_id[0], 'a');
    EXPECT_EQ(short_id[3], 0);
}

TEST_F(TransferManagerTest, ExpectedChecksumValidation) {
    transport_->announce(9, 7, 100, "incoming.bin");
    auto incoming = manager_->get_transfers_by_peer(9);
    ASSERT_EQ(incoming.size(), 1u);
    const std::string id = incoming[0]->id();

    const std::string digest = Sha256::hash("anything");
    EXPECT_EQ(manager_->set_expected_checksum(id, "abc").error, TransferErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(manager_->set_expected_checksum(id, std::string(64, 'z')).error, TransferErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(manager_->set_expected_checksum("missing", digest).error, TransferErrorCode::NOT_FOUND);

    std::string upper = digest;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    EXPECT_TRUE(manager_->set_expected_checksum(id, upper).success);
    EXPECT_EQ(incoming[0]->expected_checksum(), digest);

    auto outgoing = manager_->send_file(5, kHelloPath);
    ASSERT_NE(outgoing, nullptr);
    EXPECT_EQ(manager_->set_expected_checksum(outgoing->id(), digest).error, TransferErrorCode::WRONG_DIRECTION);
}

TEST_F(TransferManagerTest, SetConfigKeepsEventQueueSettings) {
    TransferConfig config;
    config.max_file_size = 1000;
    config.event_workers = 8;
    config.event_queue_capacity = 3;
    manager_->set_config(config);

    TransferConfig current = manager_->get_config();
    EXPECT_EQ(current.max_file_size, 1000u);
    EXPECT_EQ(current.event_workers, 0u);
    EXPECT_EQ(current.event_queue_capacity, 1024u);
}

TEST_F(TransferManagerTest, DestructorDetachesTransport) {
    manager_.reset();
    EXPECT_FALSE(transport_->has_callbacks());
}

TEST_F(TransferManagerTest, StartSendBindConflictCancelsAnnounce) {
    // An incoming announce already holds handle 1 for peer 5
    transport_->announce(5, 1, 13, "incoming.txt");
    ASSERT_EQ(manager_->get_transfers_by_peer(5).size(), 1u);

    auto transfer = manager_->send_file(5, kHelloPath);
    ASSERT_NE(transfer, nullptr);

    EXPECT_CALL(*transport_, initiate(_, _, _, _, _, _))
        .WillOnce(DoAll(SetArgReferee<5>(1u), Return(TransferResult::Success())));
    EXPECT_CALL(*transport_, control(5u, 1u, FileControl::CANCEL))
        .WillOnce(Return(TransferResult::Success()));

    TransferResult result = manager_->start_send(transfer);
    EXPECT_EQ(result.error, TransferErrorCode::TRANSPORT_ERROR);
    EXPECT_EQ(transfer->state(), TransferState::FAILED);
}

TEST_F(TransferManagerTest, SetTransportDetachesPreviousTransport) {
    auto replacement = std::make_shared<NiceMock<MockTransport>>();
    manager_->set_transport(replacement);

    EXPECT_FALSE(transport_->has_callbacks());
    EXPECT_TRUE(replacement->has_callbacks());
    EXPECT_EQ(manager_->get_transport(), replacement);

    // Re-attaching the current transport keeps its callbacks
    manager_->set_transport(replacement);
    EXPECT_TRUE(replacement->has_callbacks());
}

TEST_F(TransferManagerTest, EventWorkersAreCapped) {
    TransferConfig config;
    config.event_workers = 100000;
    TransferManager manager(config);
    EXPECT_EQ(manager.get_config().event_workers, kMaxEventWorkers);
}

TEST_F(TransferManagerTest, LogLinesCarryManagerPointer) {
    std::mutex mutex;
    std::vector<std::string> lines;
    Logger& logger = Logger::getInstance();
    LogLevel saved_level = logger.get_log_level();
    logger.set_log_level(LogLevel::DEBUG);
    logger.set_sink([&](LogLevel, const std::string& module, const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex);
        if (module == "transfer") {
            lines.push_back(line);
        }
    });

    std::ostringstream expected;
    {
        TransferConfig config;
        config.event_workers = 0;
        TransferManager manager(config);
        expected << "[pointer: " << &manager << "]";
    }

    logger.set_sink(nullptr);
    logger.set_log_level(saved_level);

    ASSERT_FALSE(lines.empty());
    for (const auto& line : lines) {
        EXPECT_NE(line.find(expected.str()), std::string::npos) << line;
    }
}
