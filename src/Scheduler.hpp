/**
 * MIT License
 *
 * @brief OutputScheduler: fixed-period tick that turns joystick state into a PPM pulse train.
 *
 * @file Scheduler.hpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <Types.hpp>
#include <Config.hpp>
#include <Constants.hpp>
#include <Registry.hpp>
#include <Assembler.hpp>
#include <Waveform.hpp>
#include <Ticker.hpp>
#include <Table.hpp>

namespace ppm
{
    /// @brief Log sink that discards everything.
    struct NullLog
    {
        void print(const char *) {}
        void println() {}
    };

    /**
     * @brief Hook called when a device takes a slot; overload it (found by ADL)
     * for device types that normalize raw samples.
     */
    template <typename Device>
    inline void apply_calibration(Device &, const AxisCalibration &) {}

    /**
     * @brief Drives the pulse-output backend from the device registry.
     *
     * States: Idle (no devices, backend stopped) and Emitting (a fresh frame is
     * submitted every tick). The tick period equals the configured frame length.
     * When the last device disappears the next tick stops the backend, so the
     * transmitter gets its own sticks back.
     *
     * @tparam Device Input device type (see Mapper.hpp for the read interface).
     * @tparam Backend Pulse output with: bool submit(const Waveform&), void stop(), bool active().
     * @tparam Indicators Status outputs with: void setReady(bool), void setAlive(bool).
     * @tparam Lock Registry lock policy.
     * @tparam Log Print-like sink with print(const char*) and println() (e.g. Serial).
     */
    template <class Device, class Backend, class Indicators, class Lock = NullLock, class Log = NullLog>
    class OutputScheduler
    {
    public:
        using Registry = DeviceRegistry<Device, Lock>;
        using Event = typename Registry::Event;

        /**
         * @brief Construct with collaborators (none are owned).
         * @param reg Device registry shared with the hotplug path.
         * @param out Pulse-output backend.
         * @param leds Status indicators.
         * @param log Optional log sink (nullptr = silent).
         */
        OutputScheduler(Registry &reg, Backend &out, Indicators &leds, Log *log = nullptr)
            : reg_(reg), out_(out), leds_(leds), log_(log), assembler_(cfg_) {}

        OutputScheduler(const OutputScheduler &) = delete;
        OutputScheduler &operator=(const OutputScheduler &) = delete;

        /**
         * @brief Validate and apply a configuration, light the ready indicator and arm the tick.
         * @param c Configuration.
         * @param now_us Current time (µs); the first tick is due immediately.
         * @return ConfigError::None on success; on error nothing is started.
         */
        ConfigError begin(const PpmConfig &c, std::uint32_t now_us)
        {
            const ConfigError err = validate(c);
            if (err != ConfigError::None)
            {
                log_line("Config rejected: %s", to_string(err));
                return err;
            }

            cfg_ = c;
            status_ = SchedulerStatus{};
            hb_count_ = 0;
            table_count_ = 0;
            alive_ = false;
            fps_t0_ = now_us;
            fps_frames0_ = 0;

            ticker_.start(cfg_.timing.frame_us, now_us);
            leds_.setReady(true);
            leds_.setAlive(false);
            started_ = true;
            log_line("PPM scheduler started (frame %lu us).", static_cast<unsigned long>(cfg_.timing.frame_us));
            return ConfigError::None;
        }

        /**
         * @brief Poll from loop(); runs a tick when one is due.
         * @param now_us Current time (µs), e.g. micros().
         * @return true if a tick ran.
         */
        bool update(std::uint32_t now_us)
        {
            if (!started_ || !ticker_.due(now_us))
                return false;
            tick(now_us);
            return true;
        }

        /**
         * @brief Run one tick now (update() calls this on schedule).
         * @param now_us Current time (µs).
         */
        void tick(std::uint32_t now_us)
        {
            status_.ticks++;

            // Hotplug first, so this tick already sees the new device list.
            reg_.process_events([this](const Event &e) { on_hotplug(e); });

            const typename Registry::Snapshot snap = reg_.snapshot();
            status_.devices = snap.count;

            if (snap.count == 0)
            {
                if (status_.state == SchedulerState::Emitting || out_.active())
                {
                    out_.stop();
                    if (status_.state == SchedulerState::Emitting)
                        log_line("No input devices: PPM output stopped.");
                }
                status_.state = SchedulerState::Idle;
            }
            else
            {
                if (status_.state == SchedulerState::Idle)
                {
                    status_.state = SchedulerState::Emitting;
                    log_line("PPM output started (%u device(s)).", static_cast<unsigned>(snap.count));
                }

                last_ = assembler_.assemble(snap);
                const Waveform w = build_waveform(last_, cfg_.timing, cfg_.polarity);
                if (out_.submit(w))
                {
                    status_.frames++;
                }
                else
                {
                    status_.rejected++;
                    log_line("Waveform rejected by output; retrying next tick.");
                }
            }

            // Heartbeat runs in both states.
            if (++hb_count_ >= cfg_.heartbeat_ticks)
            {
                hb_count_ = 0;
                alive_ = !alive_;
                leds_.setAlive(alive_);
            }

            if (cfg_.table_ticks != 0 && log_ != nullptr && ++table_count_ >= cfg_.table_ticks)
            {
                table_count_ = 0;
                print_table(*log_, cfg_, status_.state == SchedulerState::Emitting ? &last_ : nullptr, snap.count);
            }

            status_.dropped_ticks = ticker_.dropped();

            // FPS estimator (~1 s window).
            const std::uint32_t dt = now_us - fps_t0_;
            if (dt >= 1000000u)
            {
                const std::uint32_t df = status_.frames - fps_frames0_;
                status_.fps = static_cast<std::uint16_t>((static_cast<std::uint64_t>(df) * 1000000u) / dt);
                fps_t0_ = now_us;
                fps_frames0_ = status_.frames;
            }
        }

        /**
         * @brief Stop output and clear the indicators; no pulses remain after this returns.
         */
        void end()
        {
            out_.stop();
            leds_.setAlive(false);
            leds_.setReady(false);
            ticker_.stop();
            started_ = false;
            alive_ = false;
            status_.state = SchedulerState::Idle;
            log_line("PPM scheduler stopped.");
        }

        /**
         * @brief Obtain a snapshot of the scheduler status.
         * @return Const reference to internal status.
         */
        const SchedulerStatus &status() const noexcept { return status_; }

        SchedulerState state() const noexcept { return status_.state; }

        /// @brief Last frame assembled while emitting.
        const PulseFrame &last_frame() const noexcept { return last_; }

        const PpmConfig &config() const noexcept { return cfg_; }

        bool started() const noexcept { return started_; }

        /// @brief Microseconds until the next tick is due.
        std::uint32_t remaining(std::uint32_t now_us) const { return ticker_.remaining(now_us); }

    private:
        void on_hotplug(const Event &e)
        {
            if (e.kind == HotplugKind::Attach)
            {
                if (e.slot >= 0)
                {
                    status_.attaches++;
                    apply_calibration(*e.handle, cfg_.devices[e.slot]);
                    log_line("Joystick attached as joy%d (%u axes, %u buttons, %u hats).", e.slot,
                         static_cast<unsigned>(e.info.axis_count),
                         static_cast<unsigned>(e.info.button_count),
                         static_cast<unsigned>(e.info.hat_count));
                }
                else
                {
                    log_line("Joystick ignored: all %u slots in use.", static_cast<unsigned>(kMaxDevices));
                }
            }
            else if (e.slot >= 0)
            {
                status_.detaches++;
                log_line("Joystick joy%d removed.", e.slot);
            }
        }

        /// @brief printf-style single line to the sink.
        void log_line(const char *fmt, ...)
        {
            if (log_ == nullptr)
                return;
            char buf[96];
            va_list ap;
            va_start(ap, fmt);
            std::vsnprintf(buf, sizeof(buf), fmt, ap);
            va_end(ap);
            log_->print(buf);
            log_->println();
        }

        Registry &reg_;     ///< Device registry (not owned).
        Backend &out_;      ///< Pulse output (not owned).
        Indicators &leds_;  ///< Status LEDs (not owned).
        Log *log_;          ///< Optional sink (not owned).

        PpmConfig cfg_{};            ///< Active configuration.
        FrameAssembler assembler_;   ///< Bound to cfg_.
        FixedTicker ticker_{};       ///< Tick source.
        PulseFrame last_{};          ///< Last assembled frame.
        SchedulerStatus status_{};   ///< Counters and state.

        std::uint16_t hb_count_{0};    ///< Ticks since the last heartbeat toggle.
        std::uint16_t table_count_{0}; ///< Ticks since the last table print.
        bool alive_{false};            ///< Heartbeat level.
        bool started_{false};          ///< begin() succeeded.
        std::uint32_t fps_t0_{0};      ///< FPS window start (µs).
        std::uint32_t fps_frames0_{0}; ///< Frames at window start.
    };

} ///< namespace ppm.
