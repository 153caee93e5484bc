#pragma once

#include "../PhysicsTypes.hpp"

#include <btBulletDynamicsCommon.h>
#include <memory>
#include <string>
#include <vector>

namespace kineticEngine {

    /**
     * @brief A composed collision shape and everything it owns
     *
     * Children and their back-references must outlive the compound, so
     * they are held side by side and released together.
     */
    struct BulletCompound {
        std::unique_ptr<btCompoundShape> compound;
        std::vector<std::unique_ptr<btCollisionShape>> children;
        std::vector<std::unique_ptr<BodyShapeSource>> sources;
        float mass = 0.0f;
    };

    class BulletShapeBuilder {
    public:
        /**
         * @brief Compose a body's declarative shape into one compound shape
         *
         * Each child carries a BodyShapeSource user pointer. Mass is the sum
         * of per-child contributions under the body's substance policy.
         */
        static BulletCompound build(const std::string& sourceSimulant, const BodyProperties& bodyProperties);

        static float computeVolume(const BodyBox& box);
        static float computeVolume(const BodySphere& sphere);
        static float computeVolume(const BodyCapsule& capsule);

        /// Mass of a whole shape tree, without creating any backend shape.
        static float computeMass(const BodyShape& bodyShape, const Substance& substance);

    private:
        static void attachBodyShape(const std::string& sourceSimulant, const BodyProperties& bodyProperties,
                                    const BodyShape& bodyShape, BulletCompound& result);
        static void attachChild(const std::string& sourceSimulant, const BodyProperties& bodyProperties,
                                const std::optional<BodyShapeProperties>& shapeProperties, const Vec3& center,
                                std::unique_ptr<btCollisionShape> shape, float volume, BulletCompound& result);
        static float substanceMass(const Substance& substance, float volume);
    };

}
