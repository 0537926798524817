#include <gtest/gtest.h>
#include <cli/transcript.hpp>

TEST(Transcript, AppendClosedRecords) {
    Transcript t;
    t.append(LineType::INPUT, "echo hi");
    t.append(LineType::OUTPUT, "hi");
    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t.records()[0].type, LineType::INPUT);
    EXPECT_EQ(t.records()[1].text, "hi");
    EXPECT_FALSE(t.records()[1].open);
}

TEST(Transcript, FragmentsJoinOpenRecord) {
    Transcript t;
    t.append_fragment(LineType::OUTPUT, "total 8\r\n");
    t.append_fragment(LineType::OUTPUT, "drwxr-xr-x ");
    t.append_fragment(LineType::OUTPUT, "src\r\n");
    ASSERT_EQ(t.size(), 1u);
    EXPECT_EQ(t.records()[0].text, "total 8\r\ndrwxr-xr-x src\r\n");
    EXPECT_TRUE(t.records()[0].open);

    t.close_open();
    EXPECT_FALSE(t.records()[0].open);
    t.append_fragment(LineType::OUTPUT, "more");
    EXPECT_EQ(t.size(), 2u);
}

TEST(Transcript, FramedRecordClosesFragments) {
    Transcript t;
    t.append_fragment(LineType::OUTPUT, "partial");
    t.append(LineType::ERROR, "Shell session closed by remote host");
    t.append_fragment(LineType::OUTPUT, "next");
    ASSERT_EQ(t.size(), 3u);
    EXPECT_FALSE(t.records()[0].open);
    EXPECT_EQ(t.records()[2].text, "next");
}

TEST(Transcript, EmptyFragmentIgnored) {
    Transcript t;
    t.append_fragment(LineType::OUTPUT, "");
    EXPECT_TRUE(t.empty());
}

TEST(Transcript, ListenersSeeChanges) {
    Transcript t;
    std::vector<std::string> added;
    std::vector<size_t> indexes;
    bool cleared = false;
    t.set_listener([&](size_t index, const TranscriptRecord&, const std::string& text) {
        indexes.push_back(index);
        added.push_back(text);
    });
    t.set_clear_listener([&] { cleared = true; });

    t.append(LineType::OUTPUT, "a");
    t.append_fragment(LineType::OUTPUT, "b");
    t.append_fragment(LineType::OUTPUT, "c");
    EXPECT_EQ(added, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(indexes, (std::vector<size_t>{0, 1, 1}));

    t.clear();
    EXPECT_TRUE(cleared);
    EXPECT_TRUE(t.empty());
}
