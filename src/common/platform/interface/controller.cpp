#include "controller.hpp"

/**
 * Checks the controllers in order and returns the first pending event. Unlike
 * the hardware buttons, events are queued, so we must not poll the remaining
 * controllers once one of them has produced an event; it would get lost.
 */
bool poll_input(std::vector<InputController *> *controllers,
                InputEvent *registered_event)
{
        for (InputController *controller : *controllers) {
                if (controller->poll_for_input(registered_event)) {
                        return true;
                }
        }
        return false;
}
