/**
 * @file stb_impl.cpp
 * @brief Single translation unit holding the stb_image_write implementation
 */

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>
