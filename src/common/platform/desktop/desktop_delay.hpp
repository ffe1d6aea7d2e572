#pragma once
#include "../interface/delay.hpp"
#include <chrono>
#include <ctime>
#include <thread>

/**
 * Delay provider implementation for the desktop platform.
 */
class DesktopDelay : public DelayProvider
{
      public:
        void delay_ms(int ms) override
        {
                std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        }
};

class DesktopClock : public TimeProvider
{
      public:
        DesktopClock() : start(std::chrono::steady_clock::now()) {}

        long long millis() override
        {
                auto elapsed = std::chrono::steady_clock::now() - start;
                return std::chrono::duration_cast<std::chrono::milliseconds>(
                           elapsed)
                    .count();
        }

        long long epoch_seconds() override
        {
                return (long long)std::time(nullptr);
        }

      private:
        std::chrono::steady_clock::time_point start;
};
