/// @file stb_impl.cpp
/// @brief stb_image implementation unit

#define STB_IMAGE_IMPLEMENTATION
#define STBI_WINDOWS_UTF8
#include <stb_image.h>
