#ifndef COMPOSITING_H
#define COMPOSITING_H

#include "image.h"

// Alpha-over of two RGBA canvases of the same size, overlay on top of base.
// outA = srcA + dstA * (1 - srcA), outC = (srcC * srcA + dstC * dstA * (1 - srcA)) / outA
Image compositeOver(const Image& base, const Image& overlay);

// Blend src (RGB or RGBA) into the RGBA base through an L-mode mask: base = src * m + base * (1 - m)
void pasteWithMask(Image& base, const Image& src, const Image& mask);

#endif // COMPOSITING_H
