#pragma once

/**
 * Allows the game loop to pause between frames without depending on the
 * concrete platform.
 */
class DelayProvider
{
      public:
        virtual ~DelayProvider() = default;
        virtual void delay_ms(int ms) = 0;
};

/**
 * Source of time for the game timer and leaderboard timestamps.
 */
class TimeProvider
{
      public:
        virtual ~TimeProvider() = default;
        /**
         * Milliseconds from an arbitrary, fixed starting point. Only the
         * differences between two readings are meaningful.
         */
        virtual long long millis() = 0;
        /**
         * Wall-clock time as seconds since the Unix epoch.
         */
        virtual long long epoch_seconds() = 0;
};
