#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <prism/core/bitmap.hpp>
#include <prism/core/camera.hpp>
#include <prism/core/integrator.hpp>
#include <prism/core/material.hpp>
#include <prism/core/ray.hpp>
#include <prism/core/render.hpp>
#include <prism/core/scene.hpp>
#include <prism/core/sphere.hpp>
#include <prism/core/world.hpp>
#include <prism/log/logger.hpp>
#include <prism/math/rng.hpp>
#include <prism/math/vec.hpp>

#include <pybind11/numpy.h>
#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace prism::core;
using namespace prism::math;
using namespace prism::log;

PYBIND11_MODULE(prism_rt, m) {
  m.doc() = "Python bindings for the prism path tracing core";

  // Vector bindings
  py::class_<Vec3>(m, "Vec3")
      .def(py::init<>())
      .def(py::init<float, float, float>(), py::arg("x"), py::arg("y"), py::arg("z"))
      .def_readwrite("x", &Vec3::x)
      .def_readwrite("y", &Vec3::y)
      .def_readwrite("z", &Vec3::z)
      .def(py::self + py::self)
      .def(py::self - py::self)
      .def(py::self * py::self)
      .def(py::self * float())
      .def(float() * py::self)
      .def(-py::self)
      .def("length", [](const Vec3 &v) { return length(v); })
      .def("squared_length", [](const Vec3 &v) { return squared_length(v); })
      .def("unit_vector", [](const Vec3 &v) { return unit_vector(v); })
      .def("__repr__", [](const Vec3 &v) {
        return "Vec3(" + std::to_string(v.x) + ", " + std::to_string(v.y) + ", " + std::to_string(v.z) + ")";
      });

  m.def("dot", &dot, py::arg("a"), py::arg("b"));
  m.def("cross", &cross, py::arg("a"), py::arg("b"));
  m.def("lerp", &lerp, py::arg("from"), py::arg("to"), py::arg("t"),
        "Linear interpolation with t clamped to [0, 1]");
  m.def("reflect", &reflect, py::arg("v"), py::arg("n"));

  // Rng bindings
  py::class_<Rng>(m, "Rng")
      .def(py::init<uint64_t>(), py::arg("seed") = std::random_device{}(),
           "Initialize the RNG with an optional seed")
      .def("uniform", py::overload_cast<>(&Rng::uniform),
           "Generate a uniform random number in [0, 1)");

  m.def("random_in_unit_sphere", &random_in_unit_sphere, py::arg("rng"),
        "Uniform point strictly inside the unit ball");

  py::class_<Ray>(m, "Ray")
      .def(py::init<Vec3, Vec3>(), py::arg("origin"), py::arg("direction"))
      .def_readwrite("origin", &Ray::origin)
      .def_readwrite("direction", &Ray::direction)
      .def("point_at_parameter", &Ray::point_at_parameter, py::arg("t"));

  py::class_<Hit>(m, "Hit")
      .def_readonly("t", &Hit::t)
      .def_readonly("position", &Hit::position)
      .def_readonly("normal", &Hit::normal);

  // Material bindings
  py::class_<Material, std::shared_ptr<Material>>(m, "Material")
      .def("scatter", [](const Material &mat, const Ray &incoming, const Hit &hit, Rng &rng) -> py::object {
             auto rec = mat.scatter(incoming, hit, rng);
             if (!rec)
               return py::none();
             return py::make_tuple(rec->attenuation, rec->scattered);
           },
           py::arg("incoming"), py::arg("hit"), py::arg("rng"),
           "Return (attenuation, scattered_ray), or None if absorbed");

  py::class_<Diffuse, Material, std::shared_ptr<Diffuse>>(m, "Diffuse")
      .def(py::init<Vec3>(), py::arg("albedo"))
      .def_readonly("albedo", &Diffuse::albedo);

  py::class_<Metal, Material, std::shared_ptr<Metal>>(m, "Metal")
      .def(py::init<Vec3, float>(), py::arg("albedo"), py::arg("fuzz") = 0.0f)
      .def_readonly("albedo", &Metal::albedo)
      .def_readonly("fuzz", &Metal::fuzz);

  py::class_<Sphere>(m, "Sphere")
      .def(py::init([](Vec3 center, float radius, std::shared_ptr<Material> material) {
             return Sphere(center, radius, std::move(material));
           }),
           py::arg("center"), py::arg("radius"), py::arg("material"))
      .def_readonly("center", &Sphere::center)
      .def_readonly("radius", &Sphere::radius)
      .def("hit", &Sphere::hit, py::arg("ray"), py::arg("t_min"), py::arg("t_max"),
           "Nearest intersection in (t_min, t_max), or None");

  py::class_<World>(m, "World")
      .def(py::init<>())
      .def("add", &World::add, py::arg("sphere"))
      .def("__len__", &World::size)
      .def("hit", [](const World &w, const Ray &ray, float t_min, float t_max) -> std::optional<Hit> {
             auto h = w.hit(ray, t_min, t_max);
             if (!h)
               return std::nullopt;
             return h->hit;
           },
           py::arg("ray"), py::arg("t_min"), py::arg("t_max"));

  py::class_<Camera>(m, "Camera")
      .def(py::init<Vec3, Vec3, Vec3, float, float>(), py::arg("origin"),
           py::arg("look_at"), py::arg("up"), py::arg("vfov_deg"), py::arg("aspect"))
      .def("ray", &Camera::ray, py::arg("s"), py::arg("t"));

  m.def("default_world", &make_default_world);
  m.def("default_camera", &make_default_camera, py::arg("aspect"));

  m.def("background", &background, py::arg("ray"));
  m.def("color", &color, py::arg("ray"), py::arg("world"), py::arg("bounces_remaining"),
        py::arg("rng"), "Radiance arriving along ray");

  py::class_<Bitmap>(m, "Bitmap")
      .def(py::init<std::size_t, std::size_t>(), py::arg("width"), py::arg("height"))
      .def_property_readonly("width", &Bitmap::width)
      .def_property_readonly("height", &Bitmap::height)
      .def("mark", &Bitmap::mark, py::arg("x"), py::arg("y"))
      .def("to_array", [](const Bitmap &b) {
        py::array_t<std::uint32_t> out({b.height(), b.width()});
        std::copy(b.buffer().begin(), b.buffer().end(), out.mutable_data());
        return out;
      });

  // keep_alive ties the world and camera to the config's lifetime
  py::class_<RenderConfig>(m, "RenderConfig")
      .def(py::init<const World *, const Camera *>(), py::arg("world"), py::arg("camera"),
           py::keep_alive<1, 2>(), py::keep_alive<1, 3>())
      .def(py::init<std::uint64_t, const World *, const Camera *>(), py::arg("seed"),
           py::arg("world"), py::arg("camera"), py::keep_alive<1, 3>(), py::keep_alive<1, 4>())
      .def_readwrite("seed", &RenderConfig::seed)
      .def_readwrite("n_threads", &RenderConfig::n_threads)
      .def_readwrite("aa_samples", &RenderConfig::aa_samples)
      .def_readwrite("max_bounces", &RenderConfig::max_bounces)
      .def_readwrite("jitter", &RenderConfig::jitter);

  m.def(
      "render_frame",
      [](const RenderConfig &config, Bitmap &bitmap) {
        py::gil_scoped_release release;
        render_frame(config, bitmap);
      },
      py::arg("config"), py::arg("bitmap"), "Render serially into bitmap");

  m.def(
      "render_frame_parallel",
      [](const RenderConfig &config, Bitmap &bitmap) {
        py::gil_scoped_release release;
        render_frame_parallel(config, bitmap);
      },
      py::arg("config"), py::arg("bitmap"), "Render into bitmap with one thread per row band");

  m.def(
      "render",
      [](const RenderConfig &config, std::size_t width, std::size_t height) {
        Bitmap bitmap(width, height);
        {
          py::gil_scoped_release release;
          render_frame_parallel(config, bitmap);
        }
        py::array_t<std::uint32_t> out({height, width});
        std::copy(bitmap.buffer().begin(), bitmap.buffer().end(), out.mutable_data());
        return out;
      },
      py::arg("config"), py::arg("width"), py::arg("height"),
      "Render a new (height, width) uint32 image, top row first");

  // Logger bindings
  py::enum_<Level>(m, "LogLevel")
      .value("debug", Level::debug)
      .value("info", Level::info)
      .value("warn", Level::warn)
      .value("error", Level::error)
      .value("off", Level::off)
      .export_values();

  m.def(
      "set_log_level", [](Level level) { Logger::instance().set_level(level); },
      py::arg("level"), "Set the logging level for the prism_rt module");
}
