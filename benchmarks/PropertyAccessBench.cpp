#include <iostream>

#include <NGIN/Benchmark.hpp>
#include <Propel/Properties/Properties.hpp>

using namespace NGIN;

namespace BenchDemo
{
  using namespace Propel::Properties;

  struct Obj
  {
    int n{0};
    std::int64_t wide{0};
    SimpleObservable<double> ratio{0.5};

    int getN() const { return n; }
    void setN(int v) { n = v; }
    // Member type differs from the accessors, so only the boxed path applies.
    int getWide() const { return static_cast<int>(wide); }
    void setWide(int v) { wide = v; }
    Observable<double> &ratioProperty() { return ratio; }

    friend void PropelReflect(Tag<Obj>, ClassBuilder<Obj> &b)
    {
      b.Method<&Obj::getN>("getN");
      b.Method<&Obj::setN>("setN");
      b.Field<&Obj::wide>();
      b.Method<&Obj::getWide>("getWide");
      b.Method<&Obj::setWide>("setWide");
      b.Method<&Obj::ratioProperty>("ratioProperty");
    }
  };
}

int main()
{
  using namespace Propel::Properties;
  using BenchDemo::Obj;

  auto registry = RegistryBuilder{}.Build<Obj>().value();
  auto n = registry->GetIntProperty("n").value();
  auto boxed = registry->Get("n").value();
  auto wide = registry->GetLongProperty("wide").value();
  auto ratio = registry->GetDoubleProperty("ratio").value();

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Obj o{};
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      (void)n.Set(o, i);
      sum += n.Get(o).value();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "IntProperty get/set (unboxed) 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Obj o{};
    const auto ref = ObjectRef::Of(o);
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      (void)boxed->SetValue(ref, Any{i});
      sum += boxed->GetValue(ref).value()->Cast<int>();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "GetValue/SetValue int (boxed) 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Obj o{};
    ctx.start();
    std::int64_t sum = 0;
    for (int i=0;i<10000;++i) {
      (void)wide.Set(o, i);
      sum += wide.Get(o).value();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "LongProperty over int accessors (converted) 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Obj o{};
    ctx.start();
    double sum = 0.0;
    for (int i=0;i<10000;++i) {
      (void)ratio.Set(o, i * 0.5);
      sum += ratio.Get(o).value();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "DoubleProperty through observable 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Obj o{};
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      o.setN(i);
      sum += o.getN();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Direct getN/setN 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    std::size_t total = 0;
    for (int i=0;i<100;++i) {
      auto all = RegistryBuilder{}.BuildAll<Obj>().value();
      total += all.Size();
    }
    ctx.doNotOptimize(total);
    ctx.stop(); }, "BuildAll Obj 100x");

  auto results = Benchmark::RunAll<Milliseconds>();
  Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
