#include "BulletShapeBuilder.hpp"
#include "BulletConversions.hpp"
#include "../../../core/Logger.hpp"

#include <cmath>
#include <type_traits>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace kineticEngine {

    namespace {
        const float kPi = static_cast<float>(M_PI);

        BodyBox toPlainBox(const BodyBoxRounded& rounded) {
            BodyBox box;
            box.center = rounded.center;
            box.size = rounded.size;
            box.propertiesOpt = rounded.propertiesOpt;
            return box;
        }
    }

    float BulletShapeBuilder::computeVolume(const BodyBox& box) {
        return box.size.x * box.size.y * box.size.z;
    }

    float BulletShapeBuilder::computeVolume(const BodySphere& sphere) {
        return 4.0f / 3.0f * kPi * sphere.radius * sphere.radius * sphere.radius;
    }

    // Cylinder plus caps approximation, kept as-is for compatibility with
    // masses computed by existing content.
    float BulletShapeBuilder::computeVolume(const BodyCapsule& capsule) {
        return kPi * capsule.radius * capsule.radius * (4.0f / 3.0f * capsule.radius + capsule.height);
    }

    float BulletShapeBuilder::substanceMass(const Substance& substance, float volume) {
        if (auto* density = std::get_if<Density>(&substance)) {
            return volume * density->value;
        }
        return std::get<Mass>(substance).value;
    }

    float BulletShapeBuilder::computeMass(const BodyShape& bodyShape, const Substance& substance) {
        return std::visit([&substance](const auto& shape) -> float {
            using T = std::decay_t<decltype(shape)>;
            if constexpr (std::is_same_v<T, BodyBox> || std::is_same_v<T, BodySphere> || std::is_same_v<T, BodyCapsule>) {
                return substanceMass(substance, computeVolume(shape));
            } else if constexpr (std::is_same_v<T, BodyBoxRounded>) {
                return substanceMass(substance, computeVolume(toPlainBox(shape)));
            } else if constexpr (std::is_same_v<T, BodyShapes>) {
                float total = 0.0f;
                for (const auto& child : shape.shapes) {
                    total += computeMass(child, substance);
                }
                return total;
            } else {
                // BodyEmpty and BodyPolygon contribute nothing
                return 0.0f;
            }
        }, bodyShape.value);
    }

    BulletCompound BulletShapeBuilder::build(const std::string& sourceSimulant, const BodyProperties& bodyProperties) {
        BulletCompound result;
        result.compound = std::make_unique<btCompoundShape>();
        attachBodyShape(sourceSimulant, bodyProperties, bodyProperties.bodyShape, result);
        return result;
    }

    void BulletShapeBuilder::attachBodyShape(const std::string& sourceSimulant, const BodyProperties& bodyProperties,
                                             const BodyShape& bodyShape, BulletCompound& result) {
        std::visit([&](const auto& shape) {
            using T = std::decay_t<decltype(shape)>;
            if constexpr (std::is_same_v<T, BodyBox>) {
                attachChild(sourceSimulant, bodyProperties, shape.propertiesOpt, shape.center,
                            std::make_unique<btBoxShape>(toBullet(shape.size * 0.5f)), computeVolume(shape), result);
            } else if constexpr (std::is_same_v<T, BodySphere>) {
                attachChild(sourceSimulant, bodyProperties, shape.propertiesOpt, shape.center,
                            std::make_unique<btSphereShape>(shape.radius), computeVolume(shape), result);
            } else if constexpr (std::is_same_v<T, BodyCapsule>) {
                attachChild(sourceSimulant, bodyProperties, shape.propertiesOpt, shape.center,
                            std::make_unique<btCapsuleShape>(shape.radius, shape.height), computeVolume(shape), result);
            } else if constexpr (std::is_same_v<T, BodyBoxRounded>) {
                Logger::DebugOnce("[BulletShapeBuilder] Rounded box not supported by Bullet; creating a normal box instead.");
                attachBodyShape(sourceSimulant, bodyProperties, BodyShape(toPlainBox(shape)), result);
            } else if constexpr (std::is_same_v<T, BodyShapes>) {
                for (const auto& child : shape.shapes) {
                    attachBodyShape(sourceSimulant, bodyProperties, child, result);
                }
            }
            // BodyEmpty and BodyPolygon attach nothing
        }, bodyShape.value);
    }

    void BulletShapeBuilder::attachChild(const std::string& sourceSimulant, const BodyProperties& bodyProperties,
                                         const std::optional<BodyShapeProperties>& shapeProperties, const Vec3& center,
                                         std::unique_ptr<btCollisionShape> shape, float volume, BulletCompound& result) {
        auto source = std::make_unique<BodyShapeSource>();
        source->simulant = sourceSimulant;
        source->bodyId = bodyProperties.bodyId;
        source->shapeId = shapeProperties ? shapeProperties->bodyShapeId : 0;
        shape->setUserPointer(source.get());

        btTransform localTransform;
        localTransform.setIdentity();
        localTransform.setOrigin(toBullet(center));
        result.compound->addChildShape(localTransform, shape.get());

        result.mass += substanceMass(bodyProperties.substance, volume);
        result.children.push_back(std::move(shape));
        result.sources.push_back(std::move(source));
    }

}
