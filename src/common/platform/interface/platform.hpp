#pragma once
#include "controller.hpp"
#include "delay.hpp"
#include "display.hpp"
#include "persistent_storage.hpp"
#include <vector>

/**
 * Structure encapsulating all interfaces that a given implementation of the
 * platform needs to provide so that we can run the game on it.
 */
struct Platform {
        Display *display;
        std::vector<InputController *> *input_controllers;
        DelayProvider *delay_provider;
        TimeProvider *time_provider;
        PersistentStorage *persistent_storage;
};
