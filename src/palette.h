#ifndef PALETTE_H
#define PALETTE_H

#include "image.h"

// Vaulty brand colours

// Favicon
const Color SLATE_900     = {15, 23, 42, 255};
const Color INDIGO_500    = {99, 102, 241, 255};
const Color VIOLET_500    = {139, 92, 246, 255};

// Extension icon
const Color INDIGO_TOP    = {99, 102, 241, 255};
const Color INDIGO_BOTTOM = {67, 56, 202, 255};
const Color WHITE         = {255, 255, 255, 255};

const Color TRANSPARENT   = {0, 0, 0, 0};

#endif // PALETTE_H
