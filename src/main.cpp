/*
 * src/main.cpp - Main entry point for the GTK application
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "gamesentry/gui/main_window.h"

int main(int argc, char** argv) {
    return gamesentry::run_gui(argc, argv);
}
