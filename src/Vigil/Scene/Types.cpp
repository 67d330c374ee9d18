//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Vigil/Scene/Types.h>

auto vigil::scene::to_string(const ObjectType value) -> const char*
{
  switch (value) {
  case ObjectType::kMesh:
    return "MESH";
  case ObjectType::kCurve:
    return "CURVE";
  case ObjectType::kSurface:
    return "SURFACE";
  case ObjectType::kArmature:
    return "ARMATURE";
  case ObjectType::kEmpty:
    return "EMPTY";
  case ObjectType::kOther:
    return "OTHER";
  }

  return "__NotSupported__";
}

auto vigil::scene::to_string(const InteractionMode value) -> const char*
{
  switch (value) {
  case InteractionMode::kObject:
    return "OBJECT";
  case InteractionMode::kEdit:
    return "EDIT";
  case InteractionMode::kWeightPaint:
    return "WEIGHT_PAINT";
  case InteractionMode::kPose:
    return "POSE";
  case InteractionMode::kSculpt:
    return "SCULPT";
  }

  return "__NotSupported__";
}

auto vigil::scene::to_string(const ImageSource value) -> const char*
{
  switch (value) {
  case ImageSource::kFile:
    return "FILE";
  case ImageSource::kGenerated:
    return "GENERATED";
  case ImageSource::kSequence:
    return "SEQUENCE";
  case ImageSource::kMovie:
    return "MOVIE";
  case ImageSource::kViewer:
    return "VIEWER";
  }

  return "__NotSupported__";
}

auto vigil::scene::to_string(const IdType value) -> const char*
{
  switch (value) {
  case IdType::kObject:
    return "OBJECT";
  case IdType::kMesh:
    return "MESH";
  case IdType::kMaterial:
    return "MATERIAL";
  case IdType::kScene:
    return "SCENE";
  case IdType::kText:
    return "TEXT";
  }

  return "__NotSupported__";
}

auto vigil::scene::to_string(const DriverType value) -> const char*
{
  switch (value) {
  case DriverType::kAverage:
    return "AVERAGE";
  case DriverType::kSum:
    return "SUM";
  case DriverType::kScripted:
    return "SCRIPTED";
  case DriverType::kMin:
    return "MIN";
  case DriverType::kMax:
    return "MAX";
  }

  return "__NotSupported__";
}

auto vigil::scene::to_string(const ShaderNodeType value) -> const char*
{
  switch (value) {
  case ShaderNodeType::kOutputMaterial:
    return "OUTPUT_MATERIAL";
  case ShaderNodeType::kBsdfPrincipled:
    return "BSDF_PRINCIPLED";
  case ShaderNodeType::kBsdfDiffuse:
    return "BSDF_DIFFUSE";
  case ShaderNodeType::kBsdfGlossy:
    return "BSDF_GLOSSY";
  case ShaderNodeType::kEmission:
    return "EMISSION";
  case ShaderNodeType::kMixShader:
    return "MIX_SHADER";
  case ShaderNodeType::kTexImage:
    return "TEX_IMAGE";
  case ShaderNodeType::kTexEnvironment:
    return "TEX_ENVIRONMENT";
  case ShaderNodeType::kBsdfHair:
    return "BSDF_HAIR";
  case ShaderNodeType::kBsdfHairPrincipled:
    return "BSDF_HAIR_PRINCIPLED";
  case ShaderNodeType::kSubsurfaceScattering:
    return "SUBSURFACE_SCATTERING";
  case ShaderNodeType::kBsdfAnisotropic:
    return "BSDF_ANISOTROPIC";
  case ShaderNodeType::kBsdfSheen:
    return "BSDF_SHEEN";
  case ShaderNodeType::kBsdfToon:
    return "BSDF_TOON";
  case ShaderNodeType::kOther:
    return "OTHER";
  }

  return "__NotSupported__";
}
