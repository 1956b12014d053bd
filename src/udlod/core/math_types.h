/**
 * Open Space Program
 * Copyright © 2019-2024 Open Space Program Project
 *
 * MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
#pragma once

// IWYU pragma: begin_exports
#include <Magnum/Types.h>

#include <Magnum/Math/Matrix4.h>

#include <Magnum/Math/Vector.h>
#include <Magnum/Math/Vector2.h>
#include <Magnum/Math/Vector3.h>
#include <Magnum/Math/Vector4.h>

#include <Magnum/Math/Frustum.h>
#include <Magnum/Math/Range.h>
// IWYU pragma: end_exports

namespace udlod
{

using Matrix4       = Magnum::Math::Matrix4<Magnum::Float>;

using Vector2i      = Magnum::Math::Vector2<Magnum::Int>;
using Vector2ui     = Magnum::Math::Vector2<Magnum::UnsignedInt>;

using Vector2       = Magnum::Math::Vector2<Magnum::Float>;
using Vector3       = Magnum::Math::Vector3<Magnum::Float>;
using Vector4       = Magnum::Math::Vector4<Magnum::Float>;

using Range3D       = Magnum::Math::Range3D<Magnum::Float>;
using Frustum       = Magnum::Math::Frustum<Magnum::Float>;

using Rad           = Magnum::Math::Rad<Magnum::Float>;
using Deg           = Magnum::Math::Deg<Magnum::Float>;

using Magnum::Math::ZeroInit;
using Magnum::Math::IdentityInit;


} // namespace udlod
