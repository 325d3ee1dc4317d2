#include <gtest/gtest.h>
#include "zones.h"
#include "test_support.h"

class ZonesTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        TestSupport::Reset();
        settings.InitDefaults();
        zones.Init(settings);
    }

    // Allocate and record a note the way the router does
    uint8_t Start(int16_t key)
    {
        uint8_t ch = zones.AllocateChannel(key);
        zones.AddNote(key, static_cast<uint8_t>(60 + key), ch, 100);
        return ch;
    }

    Config::Settings settings;
    Zones::Manager   zones;
};

TEST_F(ZonesTest, PoolGeometry)
{
    EXPECT_EQ(zones.ZoneStart(), 1);
    EXPECT_EQ(zones.ZoneEnd(), 15);
    EXPECT_EQ(zones.ZoneSize(), 15);
}

TEST_F(ZonesTest, DistinctChannelsWhilePoolLasts)
{
    bool seen[Zones::MAX_CHANNELS] = {};
    for(int16_t key = 0; key < 15; key++)
    {
        uint8_t ch = Start(key);
        EXPECT_GE(ch, 1);
        EXPECT_LE(ch, 15);
        EXPECT_FALSE(seen[ch]) << "channel " << int(ch) << " reused";
        seen[ch] = true;
    }
    EXPECT_EQ(zones.ActiveCount(), 15u);
}

TEST_F(ZonesTest, LiveNoteKeepsItsChannel)
{
    uint8_t ch = Start(7);
    EXPECT_EQ(zones.AllocateChannel(7), ch);
    EXPECT_EQ(zones.AllocateChannel(7), ch);
    EXPECT_EQ(zones.GetChannelLoad(ch), 1);
}

TEST_F(ZonesTest, ExhaustedPoolSharesLeastLoaded)
{
    for(int16_t key = 0; key < 15; key++)
        Start(key);

    // All loads equal: lowest channel wins
    EXPECT_EQ(Start(15), 1);
    EXPECT_EQ(Start(16), 2);

    for(int16_t key = 17; key < 25; key++)
    {
        uint8_t ch  = zones.AllocateChannel(key);
        uint8_t min = 0xFF;
        for(uint8_t c = 1; c <= 15; c++)
        {
            if(zones.GetChannelLoad(c) < min)
                min = zones.GetChannelLoad(c);
        }
        EXPECT_EQ(zones.GetChannelLoad(ch), min);
        zones.AddNote(key, 60, ch, 100);
    }
}

TEST_F(ZonesTest, ReleaseFreesChannel)
{
    for(int16_t key = 0; key < 15; key++)
        Start(key);

    const Zones::NoteState* note = zones.GetNoteState(4);
    ASSERT_NE(note, nullptr);
    uint8_t freed = note->channel;

    zones.ReleaseNote(4);
    EXPECT_EQ(zones.GetChannelLoad(freed), 0);
    EXPECT_EQ(zones.AllocateChannel(20), freed);
}

TEST_F(ZonesTest, ReleasedRecordIsRetained)
{
    Start(3);
    zones.ReleaseNote(3);

    EXPECT_EQ(zones.GetNoteState(3), nullptr);
    const Zones::NoteState* record = zones.GetNoteRecord(3);
    ASSERT_NE(record, nullptr);
    EXPECT_FALSE(record->active);
    EXPECT_EQ(record->midi_note, 63);
    EXPECT_EQ(zones.ActiveCount(), 0u);
}

TEST_F(ZonesTest, ReleaseOfUnknownKeyIsHarmless)
{
    zones.ReleaseNote(9);
    Start(9);
    zones.ReleaseNote(9);
    zones.ReleaseNote(9);
    EXPECT_EQ(zones.GetChannelLoad(1), 0);
}

TEST_F(ZonesTest, SyntheticKeysAreTracked)
{
    uint8_t ch = Start(-1);
    Zones::NoteState* note = zones.GetNoteState(-1);
    ASSERT_NE(note, nullptr);
    EXPECT_EQ(note->channel, ch);
    EXPECT_EQ(note->key_id, -1);
}

TEST_F(ZonesTest, ActiveNotesListing)
{
    Start(0);
    Start(1);
    Start(2);
    zones.ReleaseNote(1);

    Zones::NoteState* active[Zones::MAX_NOTES];
    ASSERT_EQ(zones.GetActiveNotes(active, Zones::MAX_NOTES), 2u);
    EXPECT_EQ(active[0]->key_id, 0);
    EXPECT_EQ(active[1]->key_id, 2);
}

TEST_F(ZonesTest, NewNoteStartsCentred)
{
    Start(0);
    const Zones::NoteState* note = zones.GetNoteState(0);
    ASSERT_NE(note, nullptr);
    EXPECT_EQ(note->pressure, 0);
    EXPECT_EQ(note->pitch_bend, Config::PITCH_BEND_CENTER);
    EXPECT_EQ(note->timbre, Config::TIMBRE_CENTER);
}

class ReleaseVelocityTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        TestSupport::Reset();
        note.Init(0, 60, 1, 100);
    }

    Zones::NoteState note;
};

TEST_F(ReleaseVelocityTest, NeedsTwoSamples)
{
    EXPECT_EQ(note.CalculateReleaseVelocity(), 0);
    note.UpdatePressureHistory(0.5f, 0);
    EXPECT_EQ(note.CalculateReleaseVelocity(), 0);
}

TEST_F(ReleaseVelocityTest, SlowReleaseIsZero)
{
    note.UpdatePressureHistory(0.5f, 0);
    note.UpdatePressureHistory(0.499f, 1000);
    EXPECT_EQ(note.CalculateReleaseVelocity(), 0);
}

TEST_F(ReleaseVelocityTest, ModerateRelease)
{
    // 0.05 per second -> 0.05 * 2 * 127
    note.UpdatePressureHistory(0.5f, 0);
    note.UpdatePressureHistory(0.45f, 1000);
    EXPECT_EQ(note.CalculateReleaseVelocity(), 12);
}

TEST_F(ReleaseVelocityTest, FastReleaseSaturates)
{
    note.UpdatePressureHistory(1.0f, 0);
    note.UpdatePressureHistory(0.5f, 10);
    EXPECT_EQ(note.CalculateReleaseVelocity(), 127);
}

TEST_F(ReleaseVelocityTest, SameTimestampIsIgnored)
{
    note.UpdatePressureHistory(1.0f, 5);
    note.UpdatePressureHistory(0.0f, 5);
    EXPECT_EQ(note.CalculateReleaseVelocity(), 0);
}

TEST_F(ReleaseVelocityTest, HistoryKeepsNewestSamples)
{
    // Early fast drop falls out of the window
    note.UpdatePressureHistory(1.0f, 0);
    note.UpdatePressureHistory(0.5f, 1);
    for(uint32_t i = 0; i < Config::PRESSURE_HISTORY_SIZE; i++)
    {
        note.UpdatePressureHistory(0.5f, 100 + i * 100);
    }
    EXPECT_EQ(note.history_count, Config::PRESSURE_HISTORY_SIZE);
    EXPECT_EQ(note.history_time[0], 100u);
    EXPECT_EQ(note.CalculateReleaseVelocity(), 0);
    EXPECT_FLOAT_EQ(note.last_pressure, 0.5f);
}
