//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

#include <Vigil/Scene/api_export.h>

namespace vigil::scene {

//=== Object Enums ===--------------------------------------------------------//

//! Type tag of a scene object.
enum class ObjectType : uint8_t {
  kMesh,
  kCurve,
  kSurface,
  kArmature,
  kEmpty,
  kOther,
};
VGL_SCN_API auto to_string(ObjectType value) -> const char*;

//! True for object types whose data carries geometry and material slots.
[[nodiscard]] constexpr auto HasGeometry(const ObjectType type) noexcept
  -> bool
{
  return type == ObjectType::kMesh || type == ObjectType::kCurve
    || type == ObjectType::kSurface;
}

//! Interaction mode of an object. Only kObject is neutral; bulk operations
//! that rewrite data require it.
enum class InteractionMode : uint8_t {
  kObject,
  kEdit,
  kWeightPaint,
  kPose,
  kSculpt,
};
VGL_SCN_API auto to_string(InteractionMode value) -> const char*;

//=== Data Block Enums ===----------------------------------------------------//

//! Origin of an image payload.
enum class ImageSource : uint8_t {
  kFile, //!< Backed by a file on disk, unless packed
  kGenerated, //!< Procedurally generated by the host
  kSequence, //!< Image sequence
  kMovie, //!< Movie file
  kViewer, //!< Render or compositor viewer
};
VGL_SCN_API auto to_string(ImageSource value) -> const char*;

//! Kind of data-block a driver target references.
/*!
 Only objects can carry animation data of their own, so the driver chain walk
 follows kObject targets and stops at anything else.
*/
enum class IdType : uint8_t {
  kObject,
  kMesh,
  kMaterial,
  kScene,
  kText,
};
VGL_SCN_API auto to_string(IdType value) -> const char*;

//! Evaluation type of a driver.
enum class DriverType : uint8_t {
  kAverage,
  kSum,
  kScripted,
  kMin,
  kMax,
};
VGL_SCN_API auto to_string(DriverType value) -> const char*;

//=== Shading Enums ===-------------------------------------------------------//

//! Type tag of a shading node.
enum class ShaderNodeType : uint8_t {
  kOutputMaterial,
  kBsdfPrincipled,
  kBsdfDiffuse,
  kBsdfGlossy,
  kEmission,
  kMixShader,
  kTexImage,
  kTexEnvironment,
  kBsdfHair,
  kBsdfHairPrincipled,
  kSubsurfaceScattering,
  kBsdfAnisotropic,
  kBsdfSheen,
  kBsdfToon,
  kOther,
};
VGL_SCN_API auto to_string(ShaderNodeType value) -> const char*;

} // namespace vigil::scene
