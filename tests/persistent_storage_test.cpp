#include "src/common/platform/interface/persistent_storage.hpp"
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

typedef struct StoredSample {
        int32_t id;
        int64_t value;
        char tag[4];
} StoredSample;

class PersistentStorageTest : public testing::Test
{
      protected:
        std::string path;

        void SetUp() override
        {
                const testing::TestInfo *info =
                    testing::UnitTest::GetInstance()->current_test_info();
                path = testing::TempDir() + "/" + info->name() + ".state";
                std::remove(path.c_str());
        }

        void TearDown() override { std::remove(path.c_str()); }
};

TEST_F(PersistentStorageTest, InMemoryStorageStartsZeroed)
{
        PersistentStorage storage;
        int64_t value = 42;

        EXPECT_TRUE(storage.get(100, value));
        EXPECT_EQ(value, 0);
        EXPECT_FALSE(storage.is_file_backed());
}

TEST_F(PersistentStorageTest, PutThenGet)
{
        PersistentStorage storage;
        StoredSample sample = {.id = 7, .value = -123456789, .tag = "abc"};

        ASSERT_TRUE(storage.put(10, sample));

        StoredSample read = {};
        ASSERT_TRUE(storage.get(10, read));
        EXPECT_EQ(read.id, 7);
        EXPECT_EQ(read.value, -123456789);
        EXPECT_STREQ(read.tag, "abc");
}

TEST_F(PersistentStorageTest, OutOfRangeAccessIsRejected)
{
        PersistentStorage storage;
        int64_t value = 5;

        EXPECT_FALSE(storage.put(STORAGE_SIZE - 4, value));
        EXPECT_FALSE(storage.put(-1, value));
        EXPECT_FALSE(storage.get(STORAGE_SIZE, value));
        EXPECT_EQ(value, 5);
}

TEST_F(PersistentStorageTest, DataSurvivesReopening)
{
        {
                PersistentStorage storage(path);
                ASSERT_TRUE(storage.is_file_backed());
                ASSERT_TRUE(storage.put(64, (int32_t)2024));
        }

        PersistentStorage reopened(path);
        int32_t value = 0;
        ASSERT_TRUE(reopened.get(64, value));
        EXPECT_EQ(value, 2024);
}

TEST_F(PersistentStorageTest, MissingFileStartsEmpty)
{
        PersistentStorage storage(path);
        int32_t value = 9;

        ASSERT_TRUE(storage.get(0, value));
        EXPECT_EQ(value, 0);
}

TEST_F(PersistentStorageTest, ShortFileIsPaddedWithZeroes)
{
        {
                std::ofstream file(path, std::ios::binary);
                file.put(1);
                file.put(2);
                file.put(3);
        }

        PersistentStorage storage(path);
        uint8_t first = 0;
        uint8_t beyond = 9;
        ASSERT_TRUE(storage.get(0, first));
        ASSERT_TRUE(storage.get(100, beyond));
        EXPECT_EQ(first, 1);
        EXPECT_EQ(beyond, 0);
}

TEST_F(PersistentStorageTest, UnwritableFileReportsFailure)
{
        PersistentStorage storage(testing::TempDir() +
                                  "/missing_directory/storage.state");

        EXPECT_FALSE(storage.put(0, (int32_t)1));

        // The in-memory image still holds the value.
        int32_t value = 0;
        ASSERT_TRUE(storage.get(0, value));
        EXPECT_EQ(value, 1);
}
