#pragma once

// Turtle - Main header
// Include this to drive a turtle canvas and export its drawing

#include <turtle/errors.h>
#include <turtle/color.h>
#include <turtle/path.h>
#include <turtle/move.h>
#include <turtle/session.h>
#include <turtle/canvas.h>
#include <turtle/command_table.h>
#include <turtle/drawing_io.h>
