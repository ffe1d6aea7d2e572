#pragma once

#include "input.hpp"
#include <vector>

class InputController
{
      public:
        virtual ~InputController() = default;

        /**
         * For a given controller, this function checks whether an input event
         * is pending. It does not block: the game loop calls it repeatedly
         * each frame until it returns false.
         *
         * If an event is pending, it will be written into the `InputEvent
         * *event` parameter and `true` will be returned.
         *
         * If no event is pending, this function returns false and the event
         * remains unchanged.
         */
        virtual bool poll_for_input(InputEvent *event) = 0;

        /**
         * Setup function used for one-off initialization of the controller
         * before the game loop starts.
         */
        virtual void setup() = 0;
};

extern bool poll_input(std::vector<InputController *> *controllers,
                       InputEvent *registered_event);
