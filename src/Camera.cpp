#include "Camera.hpp"
#include <cmath>

Camera::Camera(glm::vec3 position)
    : Position(position), WorldUp(0.0f, 1.0f, 0.0f), Yaw(0.0f), Pitch(0.0f),
      Fov(70.0f) {
  updateCameraVectors();
}

void Camera::SetPose(glm::vec3 position, float yaw, float pitch) {
  Position = position;
  Yaw = yaw;
  // Constrain pitch to avoid screen flip
  Pitch = glm::clamp(pitch, -89.0f, 89.0f);
  updateCameraVectors();
}

glm::mat4 Camera::GetViewMatrix() const {
  return glm::lookAt(Position, Position + Front, Up);
}

glm::mat4 Camera::GetProjectionMatrix(float width, float height) const {
  if (height <= 0.0f)
    height = 1.0f;
  return glm::perspective(glm::radians(Fov), width / height, 0.05f, 500.0f);
}

void Camera::updateCameraVectors() {
  glm::vec3 front;
  front.x = cos(glm::radians(Yaw)) * cos(glm::radians(Pitch));
  front.y = sin(glm::radians(Pitch));
  front.z = sin(glm::radians(Yaw)) * cos(glm::radians(Pitch));
  Front = glm::normalize(front);

  Right = glm::normalize(glm::cross(Front, WorldUp));
  Up = glm::normalize(glm::cross(Right, Front));
}
