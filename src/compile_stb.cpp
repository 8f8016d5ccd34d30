// ============================================================================
//  File: src/compile_stb.cpp — Unité d’implémentation stb_image_write
// ============================================================================
#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable: 4244 4996)
#endif
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"
#if defined(_MSC_VER)
#pragma warning(pop)
#endif
