/**
 * ExpressDaisy - MPE velostat keyboard controller
 *
 * Features:
 * - 25 dual-pad velostat keys through a two-level mux tree
 * - Per-note pressure, pitch bend and timbre on MPE member channels
 * - 14 pots mapped to CCs, remappable by a paired expression engine
 * - Rotary encoder: octave shift (+/-3)
 * - MIDI out on UART (31250 baud, shared with the text protocol) and USB
 * - Diagnostic log on the external USB port (D29/D30)
 *
 * Text in on the UART: "cc|<pot>=<cc>|..." config, "♡" heartbeat
 */

#include "daisy_seed.h"
#include "config.h"
#include "log.h"
#include "mux.h"
#include "controller.h"

using namespace daisy;

typedef Logger<LOGGER_EXTERNAL> DebugLog;

DaisySeed          hw;
UartHandler        uart;
MidiUsbHandler     midi_usb;
Encoder            octave_encoder;
Controller::Engine controller;
Config::Settings   settings;

Mux::Multiplexer keys_l1a;
Mux::Multiplexer keys_l1b;
Mux::SelectLines keys_l2;
Mux::Multiplexer control_mux;

// ADC inputs (order = index in the ADC config)
constexpr uint8_t ADC_KEYS_L1A = 0;
constexpr uint8_t ADC_KEYS_L1B = 1;
constexpr uint8_t ADC_CONTROL  = 2;
constexpr uint8_t NUM_ADC      = 3;

// Pin assignments
static const Pin L1A_SELECT[Mux::NUM_SELECT]     = {seed::D0, seed::D1, seed::D2, seed::D3};
static const Pin L1B_SELECT[Mux::NUM_SELECT]     = {seed::D4, seed::D5, seed::D6, seed::D7};
static const Pin L2_SELECT[Mux::NUM_SELECT]      = {seed::D8, seed::D9, seed::D10, seed::D11};
static const Pin CONTROL_SELECT[Mux::NUM_SELECT] = {seed::D19, seed::D20, seed::D21, seed::D22};

constexpr Pin UART_TX       = seed::D13;
constexpr Pin UART_RX       = seed::D14;
constexpr Pin ENCODER_A     = seed::D26;
constexpr Pin ENCODER_B     = seed::D27;
constexpr Pin ENCODER_CLICK = seed::D28;

constexpr uint32_t STATS_INTERVAL = 5000;  // ms

// UART receive buffer (DMA accessible)
static uint8_t DMA_BUFFER_MEM_SECTION uart_rx_buffer[256];

/**
 * Log sink: one line per message on the external USB port
 */
void LogSink(Log::Level level, const char* tag, const char* message)
{
    DebugLog::PrintLine("%s [%s] %s", Log::LevelName(level), tag, message);
}

/**
 * UART DMA receive callback (interrupt context)
 */
void UartReceiveCallback(uint8_t* data, size_t size, void* context, UartHandler::Result result)
{
    if(result == UartHandler::Result::OK)
    {
        controller.ReceiveBytes(data, size);
    }
}

// Hardware callbacks for the controller

bool UartWrite(const uint8_t* data, size_t size)
{
    return uart.BlockingTransmit(const_cast<uint8_t*>(data), size, 10)
           == UartHandler::Result::OK;
}

bool UsbWrite(const uint8_t* data, size_t size)
{
    midi_usb.SendMessage(const_cast<uint8_t*>(data), size);
    return true;
}

/**
 * Scan all 25 keys (left/right pad pairs)
 *
 *   keys 0-4:   L2 ch 1..10 through L1A ch 0
 *   keys 5-11:  L1A ch 1..14
 *   keys 12-18: L1B ch 1..14
 *   keys 19-24: L2 ch 1..12 through L1B ch 0
 */
void ReadKeys(Keys::KeySensorSample* samples)
{
    uint8_t key = 0;

    for(uint8_t ch = 1; ch < 10; ch += 2)
    {
        keys_l2.Select(ch);
        samples[key].left_raw = keys_l1a.ReadChannel(0);
        keys_l2.Select(ch + 1);
        samples[key].right_raw = keys_l1a.ReadChannel(0);
        key++;
    }

    for(uint8_t ch = 1; ch < 15; ch += 2)
    {
        samples[key].left_raw  = keys_l1a.ReadChannel(ch);
        samples[key].right_raw = keys_l1a.ReadChannel(ch + 1);
        key++;
    }

    for(uint8_t ch = 1; ch < 15; ch += 2)
    {
        samples[key].left_raw  = keys_l1b.ReadChannel(ch);
        samples[key].right_raw = keys_l1b.ReadChannel(ch + 1);
        key++;
    }

    for(uint8_t ch = 1; ch < 12; ch += 2)
    {
        keys_l2.Select(ch);
        samples[key].left_raw = keys_l1b.ReadChannel(0);
        keys_l2.Select(ch + 1);
        samples[key].right_raw = keys_l1b.ReadChannel(0);
        key++;
    }
}

void ReadPots(uint16_t* raw)
{
    for(uint8_t i = 0; i < Config::NUM_POTS; i++)
    {
        raw[i] = control_mux.ReadChannel(i);
    }
}

int8_t ReadEncoder()
{
    octave_encoder.Debounce();
    return static_cast<int8_t>(octave_encoder.Increment());
}

uint32_t Now()
{
    return System::GetNow();
}

void Delay(uint32_t ms)
{
    System::Delay(ms);
}

/**
 * Unrecoverable startup failure: blink the Seed LED forever
 */
void Fault(const char* reason)
{
    Log::Error(Log::TAG_HW, "Startup failed: %s", reason);
    bool led = false;
    while(1)
    {
        led = !led;
        hw.SetLed(led);
        System::Delay(100);
    }
}

int main(void)
{
    // Initialize hardware
    hw.Init();

    // Diagnostic log on the external USB port
    DebugLog::StartLog(false);
    Log::SetSink(LogSink);
    Log::SetLevel(Log::Level::INFO);
    Log::Info(Log::TAG_MAIN, "ExpressDaisy starting");

    settings.InitDefaults();

    // ADC: two keyboard muxes and the control mux
    AdcChannelConfig adc_cfg[NUM_ADC];
    adc_cfg[ADC_KEYS_L1A].InitSingle(seed::A0);
    adc_cfg[ADC_KEYS_L1B].InitSingle(seed::A1);
    adc_cfg[ADC_CONTROL].InitSingle(seed::A2);
    hw.adc.Init(adc_cfg, NUM_ADC);
    hw.adc.Start();

    keys_l1a.Init(&hw.adc, ADC_KEYS_L1A, L1A_SELECT);
    keys_l1b.Init(&hw.adc, ADC_KEYS_L1B, L1B_SELECT);
    keys_l2.Init(L2_SELECT);
    control_mux.Init(&hw.adc, ADC_CONTROL, CONTROL_SELECT);
    Log::Info(Log::TAG_HW, "Multiplexers ready");

    octave_encoder.Init(ENCODER_A, ENCODER_B, ENCODER_CLICK);

    // Shared serial link: MIDI out, text protocol in
    UartHandler::Config uart_cfg;
    uart_cfg.periph        = UartHandler::Config::Peripheral::USART_1;
    uart_cfg.mode          = UartHandler::Config::Mode::TX_RX;
    uart_cfg.baudrate      = Config::UART_BAUDRATE;
    uart_cfg.stopbits      = UartHandler::Config::StopBits::BITS_1;
    uart_cfg.parity        = UartHandler::Config::Parity::NONE;
    uart_cfg.wordlength    = UartHandler::Config::WordLength::BITS_8;
    uart_cfg.pin_config.tx = UART_TX;
    uart_cfg.pin_config.rx = UART_RX;
    if(uart.Init(uart_cfg) != UartHandler::Result::OK)
    {
        Fault("UART init");
    }

    // USB MIDI on the Seed's micro USB port
    MidiUsbHandler::Config usb_cfg;
    usb_cfg.transport_config.periph = MidiUsbTransport::Config::INTERNAL;
    midi_usb.Init(usb_cfg);

    Controller::Hardware io;
    io.read_keys    = ReadKeys;
    io.read_pots    = ReadPots;
    io.read_encoder = ReadEncoder;
    io.now          = Now;
    io.delay        = Delay;
    io.uart_write   = UartWrite;
    io.usb_write    = UsbWrite;

    if(controller.Init(settings, io) != Config::Result::OK)
    {
        Fault("controller init");
    }

    // Give USB time to enumerate
    System::Delay(500);

    controller.Startup();

    if(uart.DmaListenStart(uart_rx_buffer, sizeof(uart_rx_buffer),
                           UartReceiveCallback, nullptr)
       != UartHandler::Result::OK)
    {
        Log::Error(Log::TAG_HW, "UART listen failed, config input disabled");
    }

    Log::Info(Log::TAG_MAIN, "Running");

    uint32_t last_stats = System::GetNow();

    // Main loop
    while(1)
    {
        controller.Tick();

        uint32_t now = System::GetNow();
        if(now - last_stats >= STATS_INTERVAL)
        {
            controller.LogStats();
            last_stats = now;
        }

        System::Delay(Config::MAIN_LOOP_INTERVAL);
    }
}
