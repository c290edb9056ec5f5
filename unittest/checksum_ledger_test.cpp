#include <gtest/gtest.h>
#include "backup/checksum_ledger.hpp"
#include "backup/backup_types.hpp"
#include "common/backup_status.hpp"
#include "test_utils.hpp"
#include <fstream>

class ChecksumLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ledgerPath_ = dir_.file("ledger.jsonl");
    }

    TempDir dir_;
    std::string ledgerPath_;
};

TEST_F(ChecksumLedgerTest, DigestOfKnownInput) {
    std::vector<uint8_t> abc = {'a', 'b', 'c'};
    EXPECT_EQ(toHex(ChecksumLedger::digestOf(abc, HashAlgorithm::SHA256)),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(ChecksumLedger::digestOf(abc, HashAlgorithm::SHA512).size(), 64u);
}

TEST_F(ChecksumLedgerTest, DigestOfFileMatchesDigestOfBytes) {
    auto bytes = patternBytes(100000, 3);
    writeBytes(dir_.file("unit.bin"), bytes);
    EXPECT_EQ(ChecksumLedger::digestOfFile(dir_.file("unit.bin"), HashAlgorithm::SHA256),
              ChecksumLedger::digestOf(bytes, HashAlgorithm::SHA256));
}

TEST_F(ChecksumLedgerTest, DigestOfMissingFileThrows) {
    try {
        ChecksumLedger::digestOfFile(dir_.file("absent.bin"), HashAlgorithm::SHA256);
        FAIL() << "Expected StorageIOError";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::StorageIOError);
    }
}

TEST_F(ChecksumLedgerTest, RecordAndVerify) {
    ChecksumLedger ledger;
    auto digest = ChecksumLedger::digestOf(patternBytes(64, 1), HashAlgorithm::SHA256);
    ledger.record(0, HashAlgorithm::SHA256, digest);

    EXPECT_TRUE(ledger.verify(0, HashAlgorithm::SHA256, digest));
    EXPECT_FALSE(ledger.verify(0, HashAlgorithm::SHA256, ChecksumLedger::digestOf(patternBytes(64, 2),
                                                                                   HashAlgorithm::SHA256)));
    EXPECT_TRUE(ledger.hasEntry(0, HashAlgorithm::SHA256));
    EXPECT_FALSE(ledger.hasEntry(0, HashAlgorithm::SHA512));
    EXPECT_EQ(ledger.size(), 1u);
}

TEST_F(ChecksumLedgerTest, DuplicateRecordIsRejected) {
    ChecksumLedger ledger;
    auto digest = ChecksumLedger::digestOf(patternBytes(64, 1), HashAlgorithm::SHA256);
    ledger.record(4, HashAlgorithm::SHA256, digest);

    try {
        ledger.record(4, HashAlgorithm::SHA256, digest);
        FAIL() << "Expected DuplicateEntry";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DuplicateEntry);
    }
    EXPECT_EQ(ledger.size(), 1u);

    // Same unit under another algorithm is a different entry
    EXPECT_NO_THROW(ledger.record(4, HashAlgorithm::SHA512,
                                  ChecksumLedger::digestOf(patternBytes(64, 1), HashAlgorithm::SHA512)));
}

TEST_F(ChecksumLedgerTest, VerifyWithoutEntryThrows) {
    ChecksumLedger ledger;
    try {
        ledger.verify(9, HashAlgorithm::SHA256, {});
        FAIL() << "Expected NoEntry";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NoEntry);
    }
}

TEST_F(ChecksumLedgerTest, ReloadRestoresEntries) {
    auto first = ChecksumLedger::digestOf(patternBytes(10, 1), HashAlgorithm::SHA256);
    auto second = ChecksumLedger::digestOf(patternBytes(10, 2), HashAlgorithm::SHA256);
    {
        ChecksumLedger ledger(ledgerPath_);
        ledger.record(0, HashAlgorithm::SHA256, first);
        ledger.record(1, HashAlgorithm::SHA256, second);
    }

    ChecksumLedger reloaded(ledgerPath_);
    reloaded.load();
    EXPECT_EQ(reloaded.size(), 2u);
    EXPECT_TRUE(reloaded.verify(0, HashAlgorithm::SHA256, first));
    EXPECT_TRUE(reloaded.verify(1, HashAlgorithm::SHA256, second));
    EXPECT_THROW(reloaded.record(1, HashAlgorithm::SHA256, second), BackupError);
}

TEST_F(ChecksumLedgerTest, TornFinalLineIsDropped) {
    auto digest = ChecksumLedger::digestOf(patternBytes(10, 1), HashAlgorithm::SHA256);
    {
        ChecksumLedger ledger(ledgerPath_);
        ledger.record(0, HashAlgorithm::SHA256, digest);
    }
    {
        std::ofstream out(ledgerPath_, std::ios::app);
        out << "{\"unit\":1,\"algorithm\":\"sha2";
    }

    ChecksumLedger reloaded(ledgerPath_);
    reloaded.load();
    EXPECT_EQ(reloaded.size(), 1u);
    EXPECT_FALSE(reloaded.hasEntry(1, HashAlgorithm::SHA256));

    // The unit can be hashed again after the torn write
    EXPECT_NO_THROW(reloaded.record(1, HashAlgorithm::SHA256, digest));
    ChecksumLedger again(ledgerPath_);
    again.load();
    EXPECT_EQ(again.size(), 2u);
}

TEST_F(ChecksumLedgerTest, CorruptMiddleLineIsAnError) {
    {
        std::ofstream out(ledgerPath_);
        out << "not json\n";
        out << "{\"unit\":0,\"algorithm\":\"sha256\",\"digest\":\"00\"}\n";
    }
    ChecksumLedger ledger(ledgerPath_);
    EXPECT_THROW(ledger.load(), BackupError);
}

TEST_F(ChecksumLedgerTest, ParseAlgorithmNames) {
    HashAlgorithm algorithm;
    EXPECT_TRUE(parseHashAlgorithm("sha512", algorithm));
    EXPECT_EQ(algorithm, HashAlgorithm::SHA512);
    EXPECT_EQ(hashAlgorithmToString(HashAlgorithm::SHA256), "sha256");
    EXPECT_FALSE(parseHashAlgorithm("crc32", algorithm));
}
