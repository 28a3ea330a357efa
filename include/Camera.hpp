#ifndef CUBEMAZE_CAMERA_HPP
#define CUBEMAZE_CAMERA_HPP

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

// First-person camera. Pose comes from the simulation each frame; yaw 0
// looks down +X, 90 down +Z.
class Camera {
public:
  Camera(glm::vec3 position = glm::vec3(0.0f, 1.0f, 0.0f));

  void SetPose(glm::vec3 position, float yaw, float pitch);

  glm::mat4 GetViewMatrix() const;
  glm::mat4 GetProjectionMatrix(float width, float height) const;

  glm::vec3 GetPosition() const { return Position; }

private:
  void updateCameraVectors();

  glm::vec3 Position;
  glm::vec3 Front;
  glm::vec3 Up;
  glm::vec3 Right;
  glm::vec3 WorldUp;

  float Yaw;
  float Pitch;
  float Fov;
};

#endif // CUBEMAZE_CAMERA_HPP
