// Line tests.

#include "sim/Line.h"

#include <gtest/gtest.h>
#include <vector>

namespace
{
    struct Recorder
    {
        std::vector<sim::Level> levels;
    };

    void onChange(void *arg, sim::Level level)
    {
        static_cast<Recorder *>(arg)->levels.push_back(level);
    }

}  // namespace

class LineTest : public ::testing::Test
{
protected:
    sim::Line m_line{"CSEL", sim::Level::High};
    Recorder m_rec;
};

TEST_F(LineTest, Init_HoldsInitialLevel)
{
    EXPECT_EQ(m_line.level(), sim::Level::High);
    EXPECT_STREQ(m_line.name(), "CSEL");
    EXPECT_EQ(m_line.transitions(), 0u);
}

TEST_F(LineTest, Drive_ChangeReturnsTrue)
{
    EXPECT_TRUE(m_line.drive(sim::Level::Low));
    EXPECT_EQ(m_line.level(), sim::Level::Low);
    EXPECT_EQ(m_line.transitions(), 1u);
}

TEST_F(LineTest, Drive_SameLevelIsNotATransition)
{
    ASSERT_TRUE(m_line.watch(onChange, &m_rec));

    EXPECT_FALSE(m_line.drive(sim::Level::High));
    EXPECT_EQ(m_line.transitions(), 0u);
    EXPECT_TRUE(m_rec.levels.empty());
}

TEST_F(LineTest, Watch_NotifiedSynchronouslyOnChange)
{
    ASSERT_TRUE(m_line.watch(onChange, &m_rec));

    m_line.drive(sim::Level::Low);
    m_line.drive(sim::Level::HighZ);

    ASSERT_EQ(m_rec.levels.size(), 2u);
    EXPECT_EQ(m_rec.levels[0], sim::Level::Low);
    EXPECT_EQ(m_rec.levels[1], sim::Level::HighZ);
}

TEST_F(LineTest, Watch_TableFull)
{
    Recorder recs[sim::kMaxLineWatchers + 1];
    for (std::uint8_t i = 0; i < sim::kMaxLineWatchers; ++i)
    {
        EXPECT_TRUE(m_line.watch(onChange, &recs[i]));
    }
    EXPECT_FALSE(m_line.watch(onChange, &recs[sim::kMaxLineWatchers]));

    m_line.drive(sim::Level::Low);
    EXPECT_EQ(recs[0].levels.size(), 1u);
    EXPECT_EQ(recs[sim::kMaxLineWatchers - 1].levels.size(), 1u);
    EXPECT_TRUE(recs[sim::kMaxLineWatchers].levels.empty());
}

TEST_F(LineTest, LevelChar_AllLevels)
{
    EXPECT_EQ(sim::levelChar(sim::Level::Low), '0');
    EXPECT_EQ(sim::levelChar(sim::Level::High), '1');
    EXPECT_EQ(sim::levelChar(sim::Level::HighZ), 'z');
    EXPECT_EQ(sim::toLevel(true), sim::Level::High);
    EXPECT_EQ(sim::toLevel(false), sim::Level::Low);
}
