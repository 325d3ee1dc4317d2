#include <gtest/gtest.h>
#include "notes.h"
#include "test_support.h"

using MidiEvents::Type;

class NotesTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        TestSupport::Reset();
        settings.InitDefaults();
        zones.Init(settings);
        notes.Init(settings, &zones);
        events.Clear();
    }

    Keys::KeyChange Change(int16_t key, Keys::Phase phase, float pressure,
                           float position, bool strike)
    {
        Keys::KeyChange c;
        c.key_id          = static_cast<uint8_t>(key);
        c.phase           = phase;
        c.pressure        = pressure;
        c.position        = position;
        c.has_strike      = strike;
        c.strike_velocity = strike ? pressure : 0.0f;
        return c;
    }

    // Stand-in for the router's NoteOn handling
    Zones::NoteState* Hold(int16_t key, float pressure, float position)
    {
        uint8_t           ch   = zones.AllocateChannel(key);
        Zones::NoteState* note = zones.AddNote(key, notes.NoteForKey(key), ch, 90);
        note->last_pressure    = pressure;
        note->last_position    = position;
        return note;
    }

    Config::Settings      settings;
    Zones::Manager        zones;
    Notes::Processor      notes;
    MidiEvents::EventList events;
};

TEST_F(NotesTest, VelocityRounds)
{
    EXPECT_EQ(Notes::ToVelocity(0.0f), 0);
    EXPECT_EQ(Notes::ToVelocity(0.5f), 64);
    EXPECT_EQ(Notes::ToVelocity(1.0f), 127);
    EXPECT_EQ(Notes::ToVelocity(2.0f), 127);
    EXPECT_EQ(Notes::ToVelocity(-1.0f), 0);
}

TEST_F(NotesTest, NoteOnVelocityNeverZero)
{
    EXPECT_EQ(Notes::ToNoteOnVelocity(0.0f), 1);
    EXPECT_EQ(Notes::ToNoteOnVelocity(0.002f), 1);
    EXPECT_EQ(Notes::ToNoteOnVelocity(0.5f), 64);
    EXPECT_EQ(Notes::ToNoteOnVelocity(1.0f), 127);
}

TEST_F(NotesTest, FeatherTouchStrikesAtVelocityOne)
{
    notes.ProcessKeyChange(Change(3, Keys::Phase::INITIAL_TOUCH, 0.002f, 0.0f, true), 0, events);

    ASSERT_EQ(events.count, 4u);
    EXPECT_EQ(events[3].type, Type::NOTE_ON);
    EXPECT_EQ(events[3].note_on.velocity, 1);
}

TEST_F(NotesTest, OctaveShiftNeverRetriggersAtZero)
{
    uint8_t           ch   = zones.AllocateChannel(5);
    Zones::NoteState* note = zones.AddNote(5, notes.NoteForKey(5), ch, 0);
    note->last_pressure    = 0.3f;

    ASSERT_TRUE(notes.HandleOctaveShift(1, events));
    bool found = false;
    for(size_t i = 0; i < events.count; i++)
    {
        if(events[i].type == Type::NOTE_ON)
        {
            EXPECT_EQ(events[i].note_on.velocity, 1);
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(NotesTest, KeyToNote)
{
    EXPECT_EQ(notes.NoteForKey(0), 60);
    EXPECT_EQ(notes.NoteForKey(24), 84);
}

TEST_F(NotesTest, NewNoteEventOrder)
{
    notes.ProcessKeyChange(Change(2, Keys::Phase::INITIAL_TOUCH, 0.5f, 0.25f, true), 0, events);

    ASSERT_EQ(events.count, 4u);
    EXPECT_EQ(events[0].type, Type::TIMBRE_INIT);
    EXPECT_EQ(events[1].type, Type::PRESSURE_INIT);
    EXPECT_FLOAT_EQ(events[1].expression.value, 0.5f);
    EXPECT_EQ(events[2].type, Type::PITCH_BEND_INIT);
    EXPECT_FLOAT_EQ(events[2].expression.value, 0.25f);
    EXPECT_EQ(events[3].type, Type::NOTE_ON);
    EXPECT_EQ(events[3].note_on.key_id, 2);
    EXPECT_EQ(events[3].note_on.note, 62);
    EXPECT_EQ(events[3].note_on.velocity, 64);
}

TEST_F(NotesTest, SoundingWithoutStrikeStartsNothing)
{
    notes.ProcessKeyChange(Change(2, Keys::Phase::ACTIVE, 0.5f, 0.0f, false), 0, events);
    EXPECT_EQ(events.count, 0u);
}

TEST_F(NotesTest, HeldNoteUpdates)
{
    Hold(5, 0.4f, 0.0f);
    notes.ProcessKeyChange(Change(5, Keys::Phase::ACTIVE, 0.6f, -0.3f, false), 10, events);

    ASSERT_EQ(events.count, 3u);
    EXPECT_EQ(events[0].type, Type::TIMBRE_UPDATE);
    EXPECT_EQ(events[1].type, Type::PRESSURE_UPDATE);
    EXPECT_FLOAT_EQ(events[1].expression.value, 0.6f);
    EXPECT_EQ(events[2].type, Type::PITCH_BEND_UPDATE);
    EXPECT_FLOAT_EQ(events[2].expression.value, -0.3f);

    const Zones::NoteState* note = zones.GetNoteState(5);
    EXPECT_FLOAT_EQ(note->last_pressure, 0.6f);
    EXPECT_FLOAT_EQ(note->last_position, -0.3f);
    EXPECT_EQ(note->history_count, 1);
}

TEST_F(NotesTest, ReleaseEmitsZeroPressureThenNoteOff)
{
    Hold(5, 0.4f, 0.0f);
    notes.ProcessKeyChange(Change(5, Keys::Phase::ACTIVE, 1.0f, 0.0f, false), 0, events);
    notes.ProcessKeyChange(Change(5, Keys::Phase::ACTIVE, 0.5f, 0.0f, false), 10, events);
    events.Clear();

    notes.ProcessKeyChange(Change(5, Keys::Phase::RELEASED, 0.0f, 0.0f, false), 20, events);
    ASSERT_EQ(events.count, 2u);
    EXPECT_EQ(events[0].type, Type::PRESSURE_UPDATE);
    EXPECT_FLOAT_EQ(events[0].expression.value, 0.0f);
    EXPECT_EQ(events[1].type, Type::NOTE_OFF);
    EXPECT_EQ(events[1].note_off.note, 65);
    EXPECT_EQ(events[1].note_off.velocity, 127);
    EXPECT_TRUE(events[1].note_off.release);
}

TEST_F(NotesTest, ReleaseOfSilentKeyIsIgnored)
{
    notes.ProcessKeyChange(Change(5, Keys::Phase::INACTIVE, 0.0f, 0.0f, false), 0, events);
    EXPECT_EQ(events.count, 0u);
}

TEST_F(NotesTest, OctaveShiftRetriggersHeldNotes)
{
    Hold(5, 0.5f, 0.2f);

    ASSERT_TRUE(notes.HandleOctaveShift(1, events));
    EXPECT_EQ(notes.GetOctave(), 1);

    ASSERT_EQ(events.count, 6u);
    EXPECT_EQ(events[0].type, Type::PRESSURE_INIT);
    EXPECT_FLOAT_EQ(events[0].expression.value, 0.5f);
    EXPECT_EQ(events[1].type, Type::PITCH_BEND_INIT);
    EXPECT_FLOAT_EQ(events[1].expression.value, 0.2f);
    EXPECT_EQ(events[2].type, Type::NOTE_OFF);
    EXPECT_EQ(events[2].note_off.note, 65);
    EXPECT_FALSE(events[2].note_off.release);
    EXPECT_EQ(events[3].type, Type::NOTE_ON);
    EXPECT_EQ(events[3].note_on.note, 77);
    EXPECT_EQ(events[3].note_on.velocity, 90);
    EXPECT_EQ(events[4].type, Type::PRESSURE_UPDATE);
    EXPECT_EQ(events[5].type, Type::PITCH_BEND_UPDATE);
}

TEST_F(NotesTest, OctaveShiftWithoutPressureSkipsUpdates)
{
    Hold(0, 0.0f, 0.0f);
    ASSERT_TRUE(notes.HandleOctaveShift(-1, events));
    ASSERT_EQ(events.count, 4u);
    EXPECT_EQ(events[3].note_on.note, 48);
}

TEST_F(NotesTest, OctaveIsClamped)
{
    EXPECT_TRUE(notes.HandleOctaveShift(1, events));
    EXPECT_TRUE(notes.HandleOctaveShift(1, events));
    EXPECT_TRUE(notes.HandleOctaveShift(1, events));
    EXPECT_FALSE(notes.HandleOctaveShift(1, events));
    EXPECT_EQ(notes.GetOctave(), 3);
    EXPECT_EQ(notes.NoteForKey(24), 120);

    for(int i = 0; i < 8; i++)
        notes.HandleOctaveShift(-1, events);
    EXPECT_EQ(notes.GetOctave(), -3);
    EXPECT_EQ(notes.NoteForKey(0), 24);
    EXPECT_EQ(events.count, 0u);
}

TEST_F(NotesTest, OctaveShiftLeavesGreetingNotes)
{
    uint8_t ch = zones.AllocateChannel(Notes::Processor::GreetingKey(0));
    zones.AddNote(Notes::Processor::GreetingKey(0), 60, ch, 76);

    ASSERT_TRUE(notes.HandleOctaveShift(1, events));
    EXPECT_EQ(events.count, 0u);
}

TEST_F(NotesTest, GreetingEvents)
{
    notes.GreetingNoteOn(1, events);
    ASSERT_EQ(events.count, 4u);
    EXPECT_EQ(events[0].type, Type::TIMBRE_INIT);
    EXPECT_EQ(events[3].type, Type::NOTE_ON);
    EXPECT_EQ(events[3].note_on.key_id, -2);
    EXPECT_EQ(events[3].note_on.note, 64);
    EXPECT_EQ(events[3].note_on.velocity, Notes::ToVelocity(0.7f));

    events.Clear();
    notes.GreetingNoteOff(1, events);
    ASSERT_EQ(events.count, 2u);
    EXPECT_EQ(events[1].type, Type::NOTE_OFF);
    EXPECT_EQ(events[1].note_off.key_id, -2);

    events.Clear();
    notes.GreetingNoteOn(Config::GREETING_LENGTH, events);
    EXPECT_EQ(events.count, 0u);
}
