#pragma once

/**
 * @file augmentations.hpp
 * @brief Convenience header pulling in every sequence augmentation.
 */

#include "augmentation/augmentation.hpp"
#include "augmentation/deletion.hpp"
#include "augmentation/insertion.hpp"
#include "augmentation/inversion.hpp"
#include "augmentation/mutation.hpp"
#include "augmentation/noise.hpp"
#include "augmentation/reverse_complement.hpp"
#include "augmentation/translocation.hpp"
